// include/alloc_ngin/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "alloc_ngin/core/error.hpp"

namespace alloc_ngin {

/**
 * @brief Read and parse a JSON document from disk
 * @return FILE_NOT_FOUND if the file cannot be opened, JSON_PARSE_ERROR if
 *         it is not valid JSON
 */
Result<nlohmann::json> read_json_file(const std::string& filepath);

/**
 * @brief Base class for all configuration types
 *
 * Subclasses implement to_json/from_json. from_json may throw
 * nlohmann::json exceptions for mistyped fields and std::invalid_argument
 * for values outside a recognized set; the loaders below convert both into
 * error results.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to the file
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Apply a JSON object without throwing
     * @return JSON_PARSE_ERROR for mistyped fields, INVALID_ARGUMENT for
     *         unrecognized values
     */
    Result<void> load_from_json(const nlohmann::json& j);

    /**
     * @brief Convert configuration to JSON
     * @return JSON representation of the configuration
     */
    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * @param json JSON object to load from
     */
    virtual void from_json(const nlohmann::json& j) = 0;

protected:
    /**
     * @brief Name reported as the component of load and save errors
     */
    virtual std::string config_name() const {
        return "ConfigBase";
    }
};

}  // namespace alloc_ngin
