// src/core/config_base.cpp

#include "renewfolio/core/config_base.hpp"
#include <fstream>

namespace renewfolio {

Result<nlohmann::json> read_json_file(const std::filesystem::path& path,
                                      const std::string& component) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open " + path.string() + " for reading",
                                          component);
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Malformed JSON in " + path.string() + ": " + e.what(), component);
    } catch (const std::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Error reading " + path.string() + ": " + e.what(),
                                          component);
    }
}

Result<void> write_json_file(const std::filesystem::path& path, const nlohmann::json& j,
                             const std::string& component, int indent) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + path.string() + " for writing", component);
    }
    file << j.dump(indent) << '\n';
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to write " + path.string(),
                                component);
    }
    return Result<void>();
}

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    try {
        return write_json_file(filepath, to_json(), "ConfigBase", 4);
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Error serializing config: ") + e.what(),
                                "ConfigBase");
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    auto document = read_json_file(filepath, "ConfigBase");
    if (document.is_error()) {
        return make_error<void>(document.error()->code(), document.error()->what(),
                                "ConfigBase");
    }

    try {
        from_json(document.value());
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Invalid field in " + filepath + ": " + e.what(), "ConfigBase");
    }
}

}  // namespace renewfolio
