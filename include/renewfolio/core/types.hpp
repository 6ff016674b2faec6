// include/renewfolio/core/types.hpp

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace renewfolio {

/**
 * @brief Timestamp type for consistent time representation
 * All series are hourly and interpreted in UTC
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Cadence of every series handled by the library
 */
constexpr std::chrono::hours SERIES_STEP{1};

/**
 * @brief Hours in a non-leap year, the default annualization factor
 */
constexpr double HOURS_PER_YEAR = 8760.0;

/**
 * @brief Generation technology of an asset
 */
enum class AssetKind {
    WIND,
    SOLAR
};

inline std::string asset_kind_to_string(AssetKind kind) {
    switch (kind) {
        case AssetKind::WIND:
            return "WIND";
        case AssetKind::SOLAR:
            return "SOLAR";
        default:
            return "UNKNOWN";
    }
}

}  // namespace renewfolio
