/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the curator configuration (settings.json).
 *
 * Every section of the file is optional; missing values fall back to the
 * built-in defaults, including the default taxonomy.
 */

#pragma once

#include "domain/CuratorConfig.hpp"
#include <string>

namespace channelcurator::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads and validates a settings file.
     * @param path Path to settings.json. A missing file yields the defaults.
     * @throws domain::ConfigurationError on unreadable, malformed or invalid settings.
     */
    static domain::CuratorConfig Load(const std::string& path);

    /** @brief Same as Load, from JSON text. */
    static domain::CuratorConfig Parse(const std::string& jsonText);

    /** @brief Built-in configuration (no credentials). */
    static domain::CuratorConfig Defaults();

    /**
     * @brief Overrides credentials and port from the environment.
     *
     * CURATOR_USERNAME / CURATOR_PASSWORD (falling back to USERNAME / PASSWORD)
     * and CURATOR_PORT.
     */
    static void ApplyEnvironment(domain::CuratorConfig& config);

    /** @throws domain::ConfigurationError describing the first problem found. */
    static void Validate(const domain::CuratorConfig& config);
};

} // namespace channelcurator::infrastructure
