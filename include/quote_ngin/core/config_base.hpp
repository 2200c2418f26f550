// include/quote_ngin/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "quote_ngin/core/error.hpp"

namespace quote_ngin {

/**
 * @brief Base class for all configuration types
 * Provides common serialization and deserialization methods
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
     * @brief Load configuration from JSON file and validate it
     * @param filepath Path to the file
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * @param j JSON object to load from
     * @throws nlohmann::json::exception on type mismatches
     */
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Check the loaded values for consistency
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }
};

}  // namespace quote_ngin
