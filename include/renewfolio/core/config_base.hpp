// include/renewfolio/core/config_base.hpp
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "renewfolio/core/error.hpp"

namespace renewfolio {

/**
 * @brief Read and parse a JSON document
 * @param path File to read
 * @param component Component name reported on failure
 * @return The parsed document, FILE_NOT_FOUND if the file cannot be opened
 *         or JSON_PARSE_ERROR if it is malformed
 */
Result<nlohmann::json> read_json_file(const std::filesystem::path& path,
                                      const std::string& component);

/**
 * @brief Write a JSON document, replacing any existing file
 * @param path File to write
 * @param j Document
 * @param component Component name reported on failure
 * @param indent Spaces per nesting level
 * @return FILE_IO_ERROR if the file cannot be opened or written
 */
Result<void> write_json_file(const std::filesystem::path& path, const nlohmann::json& j,
                             const std::string& component, int indent = 2);

/**
 * @brief Base class for all configuration types
 *
 * Derived types serialize every field in to_json(). from_json() only
 * overwrites the fields present in the document, so a partial document
 * leaves the remaining fields at their defaults.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Overlay the fields found in a JSON file onto this configuration
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace renewfolio
