// =================================================================
// include/Tempo/ConfigLoader.hpp
// =================================================================
// YAML loading of the aggregate configuration.

#pragma once

#include "Tempo/Config.hpp"
#include <chrono>
#include <string>

namespace YAML {
class Node;
}

namespace Tempo {

/**
 * @brief Builds a validated TempoConfig from YAML
 *
 * Durations accept an integer number of milliseconds or a string with a
 * unit suffix: "250ms", "30s", "5m", "2h". Sections and keys that are
 * absent keep their defaults. When no workers are listed the default
 * pool is used with `load_balancer.worker_capacity` per worker.
 */
class ConfigLoader {
public:
    /**
     * @brief Load and validate a configuration file
     * @param config_path Path to a YAML file
     * @return Validated configuration
     * @throws ConfigurationError when the file is unreadable, malformed or invalid
     */
    static TempoConfig loadFromFile(const std::string& config_path);

    /**
     * @brief Load and validate configuration from YAML text
     * @throws ConfigurationError when the text is malformed or invalid
     */
    static TempoConfig loadFromString(const std::string& yaml_text);

    /**
     * @brief Parse a duration value
     * @param text Integer milliseconds or a number with ms, s, m or h suffix
     * @throws ConfigurationError on malformed input
     */
    static std::chrono::milliseconds parseDuration(const std::string& text);

    /**
     * @brief Configure the process logger from the logging section
     */
    static void applyLogging(const LoggingConfig& logging);

private:
    static TempoConfig parse(const YAML::Node& root);
};

} // namespace Tempo
