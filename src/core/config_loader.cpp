// src/core/config_loader.cpp

#include "renewfolio/core/config_loader.hpp"

#include <cmath>
#include <set>

namespace renewfolio {

nlohmann::json AppConfig::to_json() const {
    nlohmann::json j;
    j["logging"] = logging.to_json();
    j["market"] = market.to_json();
    j["simulation"] = simulation.to_json();
    j["price"] = price.to_json();

    nlohmann::json asset_array = nlohmann::json::array();
    for (const auto& asset : assets) {
        asset_array.push_back(asset.to_json());
    }
    j["assets"] = asset_array;

    j["risk"] = risk.to_json();
    j["optimizer"] = optimizer.to_json();
    j["backtest"] = backtest.to_json();

    nlohmann::json stress_array = nlohmann::json::array();
    for (const auto& scenario : stress) {
        stress_array.push_back(scenario.to_json());
    }
    j["stress"] = stress_array;

    j["train_fraction"] = train_fraction;
    j["output_directory"] = output_directory;
    j["version"] = version;
    return j;
}

void AppConfig::from_json(const nlohmann::json& j) {
    if (j.contains("logging")) logging.from_json(j.at("logging"));
    if (j.contains("market")) market.from_json(j.at("market"));
    if (j.contains("simulation")) simulation.from_json(j.at("simulation"));
    if (j.contains("price")) price.from_json(j.at("price"));

    if (j.contains("assets")) {
        assets.clear();
        for (const auto& item : j.at("assets")) {
            // Unspecified fields take the defaults of the asset's technology
            const bool solar = item.contains("kind") && item.at("kind").get<std::string>() == "SOLAR";
            AssetProfile profile = solar ? AssetProfile::default_solar() : AssetProfile::default_wind();
            profile.from_json(item);
            assets.push_back(profile);
        }
    }

    if (j.contains("risk")) risk.from_json(j.at("risk"));
    if (j.contains("optimizer")) optimizer.from_json(j.at("optimizer"));
    if (j.contains("backtest")) backtest.from_json(j.at("backtest"));

    if (j.contains("stress")) {
        stress.clear();
        for (const auto& item : j.at("stress")) {
            StressScenario scenario;
            scenario.from_json(item);
            stress.push_back(scenario);
        }
    }

    if (j.contains("train_fraction")) train_fraction = j.at("train_fraction").get<double>();
    if (j.contains("output_directory")) {
        output_directory = j.at("output_directory").get<std::string>();
    }
    if (j.contains("version")) version = j.at("version").get<std::string>();
}

Result<nlohmann::json> ConfigLoader::load_json_file(const std::filesystem::path& file_path) {
    return read_json_file(file_path, "ConfigLoader");
}

void ConfigLoader::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            // Recursive merge for nested objects
            merge_json(target[key], value);
        } else {
            // Override or add, arrays are replaced whole
            target[key] = value;
        }
    }
}

Result<AppConfig> ConfigLoader::extract_config(const nlohmann::json& merged) {
    try {
        AppConfig config;
        config.from_json(merged);
        return config;
    } catch (const std::exception& e) {
        return make_error<AppConfig>(ErrorCode::CONFIGURATION_ERROR,
                                     "Failed to extract config: " + std::string(e.what()),
                                     "ConfigLoader");
    }
}

Result<void> ConfigLoader::validate_config(const AppConfig& config) {
    if (config.assets.empty()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR, "No assets configured",
                                "ConfigLoader");
    }

    std::set<std::string> names;
    for (const auto& asset : config.assets) {
        auto valid = asset.validate();
        if (valid.is_error()) {
            return valid;
        }
        if (!names.insert(asset.name).second) {
            return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                    "Duplicate asset name '" + asset.name + "'", "ConfigLoader");
        }
    }

    if (!(config.train_fraction > 0.0 && config.train_fraction < 1.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "train_fraction must be in (0, 1), got " +
                                    std::to_string(config.train_fraction),
                                "ConfigLoader");
    }
    if (config.simulation.n_realizations < 2) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "simulation.n_realizations must be at least 2", "ConfigLoader");
    }
    if (config.risk.garch.p != 1 || config.risk.garch.q != 1) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Only GARCH(1,1) is supported, got (" +
                                    std::to_string(config.risk.garch.p) + "," +
                                    std::to_string(config.risk.garch.q) + ")",
                                "ConfigLoader");
    }
    if (std::abs(config.optimizer.periods_per_year - config.backtest.periods_per_year) > 1e-9) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "optimizer.periods_per_year (" +
                                    std::to_string(config.optimizer.periods_per_year) +
                                    ") differs from backtest.periods_per_year (" +
                                    std::to_string(config.backtest.periods_per_year) + ")",
                                "ConfigLoader");
    }
    if (!(config.backtest.var_confidence > 0.0 && config.backtest.var_confidence < 1.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "backtest.var_confidence must be in (0, 1)", "ConfigLoader");
    }
    if (config.output_directory.empty()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR, "output_directory is empty",
                                "ConfigLoader");
    }
    return Result<void>();
}

void ConfigLoader::log_config_summary(const AppConfig& config) {
    auto& logger = Logger::instance();
    if (!logger.is_initialized()) {
        return;
    }
    INFO("Config summary: assets=" << config.assets.size()
                                   << ", realizations=" << config.simulation.n_realizations
                                   << ", seed=" << config.simulation.seed
                                   << ", horizon_hours=" << config.simulation.horizon_hours);
    INFO("Config summary: bounds=[" << config.optimizer.min_weight << ", "
                                    << config.optimizer.max_weight
                                    << "], risk_free_rate=" << config.optimizer.risk_free_rate
                                    << ", frontier_points=" << config.optimizer.frontier_points);
}

Result<AppConfig> ConfigLoader::from_overrides(const nlohmann::json& overrides) {
    if (!overrides.is_object()) {
        return make_error<AppConfig>(ErrorCode::CONFIGURATION_ERROR,
                                     "Configuration root must be a JSON object", "ConfigLoader");
    }

    nlohmann::json merged = AppConfig().to_json();
    merge_json(merged, overrides);

    auto extracted = extract_config(merged);
    if (extracted.is_error()) {
        return extracted;
    }
    auto valid = validate_config(extracted.value());
    if (valid.is_error()) {
        return forward_error<AppConfig>(valid.error());
    }
    log_config_summary(extracted.value());
    return extracted;
}

Result<AppConfig> ConfigLoader::load(const std::filesystem::path& config_file_path) {
    auto file_result = load_json_file(config_file_path);
    if (file_result.is_error()) {
        return forward_error<AppConfig>(file_result.error());
    }
    return from_overrides(file_result.value());
}

}  // namespace renewfolio
