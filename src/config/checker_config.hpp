#ifndef MFNF_CHECKER_CONFIG_HPP
#define MFNF_CHECKER_CONFIG_HPP

#include "logging/logger.hpp"
#include <string>
#include <stdexcept>

namespace mfnf {

/**
 * @brief Exception thrown when configuration cannot be read or is invalid
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Settings for the formula checker and its logging
 *
 * JSON layout (all fields optional):
 *   {
 *     "texvccheck_path": "${MFNF_HOME}/bin/texvccheck",
 *     "cache_size": 10000,
 *     "log_level": "INFO",
 *     "log_json": true,
 *     "log_file": "texcheck.log"
 *   }
 */
struct CheckerConfig {
    std::string texvccheck_path;  ///< Checker executable
    size_t cache_size;            ///< Capacity hint for the formula cache
    LogLevel log_level;           ///< Minimum log level
    bool log_json;                ///< JSON log lines instead of plain text
    std::string log_file;         ///< Optional log file, empty = console only

    CheckerConfig()
        : texvccheck_path("texvccheck"),
          cache_size(10000),
          log_level(LogLevel::INFO),
          log_json(true) {}
};

/**
 * @brief Parses checker settings from a JSON string
 *
 * Fields missing from the JSON keep the values of base.
 *
 * @throws ConfigParseError if JSON is invalid or a field has the wrong type
 */
CheckerConfig parse_checker_config_from_string(
    const std::string& json_string,
    const CheckerConfig& base = CheckerConfig());

/**
 * @brief Parses checker settings from a JSON file
 *
 * A relative texvccheck_path containing a '/' is resolved against the
 * directory of the file; bare command names are left for PATH lookup.
 * A relative log_file is always resolved against that directory.
 *
 * @throws ConfigParseError if the file cannot be read or is invalid
 */
CheckerConfig parse_checker_config_from_file(
    const std::string& file_path,
    const CheckerConfig& base = CheckerConfig());

/**
 * @brief Applies MFNF_TEXVCCHECK_PATH, MFNF_TEX_CACHE_SIZE and MFNF_LOG_LEVEL
 *
 * @throws ConfigParseError if a variable holds an invalid value
 */
void apply_environment_overrides(CheckerConfig& config);

/**
 * @brief Loads settings in priority order: environment, config file, defaults
 *
 * @param config_file_path JSON config file, or empty for none
 * @throws ConfigParseError on any invalid source
 */
CheckerConfig load_checker_config(const std::string& config_file_path = "");

/**
 * @brief Derives the logger configuration for the given settings
 */
LoggerConfig make_logger_config(const CheckerConfig& config);

/**
 * @brief Parses a log level name (DEBUG, INFO, WARN, ERROR)
 *
 * @throws ConfigParseError for any other name
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to
 * the empty string.
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory of a config file
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace mfnf

#endif // MFNF_CHECKER_CONFIG_HPP
