/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the reconciliation settings (JSON).
 *
 * Keeps JSON parsing of the engine configuration in one place. Keys missing
 * from the file keep their built-in defaults.
 */

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/ReconciliationConfig.hpp"

namespace casechain::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads and validates a settings file.
     * @param path Path to the JSON file.
     * @return The configuration, or nullopt if the file is unreadable or invalid.
     */
    static std::optional<domain::ReconciliationConfig> Load(const std::string& path);

    /**
     * @brief Applies the keys present in @p j over the defaults.
     * @return nullopt when a value has the wrong type or an unknown label.
     */
    static std::optional<domain::ReconciliationConfig> FromJson(const nlohmann::json& j);

    /** @brief Serializes every setting, including defaults. */
    static nlohmann::json ToJson(const domain::ReconciliationConfig& config);

    /** @brief Writes the configuration as indented JSON. */
    static bool Save(const std::string& path, const domain::ReconciliationConfig& config);
};

} // namespace casechain::infrastructure
