/**
 * @file logger.hpp
 * @brief Structured logging for the mfnf utilities with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Formula checker events (cache hits, checker invocations, evictions)
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef MFNF_LOGGER_HPP
#define MFNF_LOGGER_HPP

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <fstream>

namespace mfnf {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (cache hits, checker invocations)
    INFO,    ///< Informational messages (evictions, path changes)
    WARN,    ///< Warning messages (non-fatal issues)
    ERROR    ///< Error messages (failures, exceptions)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)
    size_t max_source_chars;         ///< Formula sources longer than this are truncated in log lines

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("mfnf-utils.log"),
          enable_json(true),
          max_source_chars(256) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "texcheck.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   logger.log_cache_hit("\\frac{1}{2}", "valid");
 *   @endcode
 *
 * All public methods are safe to call from concurrent threads.
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a formula answered from the cache
     *
     * @param source Formula source
     * @param result_kind Name of the cached result kind
     */
    void log_cache_hit(const std::string& source, const std::string& result_kind);

    /**
     * @brief Log one run of the external formula checker
     *
     * @param source Formula source passed to the checker
     * @param checker_path Checker executable
     * @param result_kind Name of the classified result kind
     * @param exit_status Exit status reported by the process
     * @param elapsed_ms Wall time of the invocation
     */
    void log_checker_invocation(
        const std::string& source,
        const std::string& checker_path,
        const std::string& result_kind,
        int exit_status,
        double elapsed_ms
    );

    /**
     * @brief Log a cache eviction pass
     *
     * @param size_before Cache size before the pass
     * @param size_after Cache size after the pass
     * @param max_size Configured capacity
     */
    void log_eviction(size_t size_before, size_t size_after, size_t max_size);

    /**
     * @brief Log replacement of the checker path
     */
    void log_path_change(const std::string& old_path, const std::string& new_path);

    /**
     * @brief Log error with context
     *
     * @param component Component reporting the error (e.g., "tex_checker")
     * @param error_message Error message
     * @param source Optional formula source the error relates to
     */
    void log_error(
        const std::string& component,
        const std::string& error_message,
        const std::string& source = ""
    );

    /**
     * @brief Log warning message
     */
    void log_warning(const std::string& component, const std::string& warning_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string truncate_source(const std::string& source) const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace mfnf

#endif // MFNF_LOGGER_HPP
