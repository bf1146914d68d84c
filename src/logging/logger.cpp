/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logging/logger.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace mfnf {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log_cache_hit(const std::string& source, const std::string& result_kind) {
    std::map<std::string, std::string> fields;
    fields["event"] = "cache_hit";
    fields["source"] = truncate_source(source);
    fields["result"] = result_kind;

    log(LogLevel::DEBUG, "Formula answered from cache", fields);
}

void Logger::log_checker_invocation(
    const std::string& source,
    const std::string& checker_path,
    const std::string& result_kind,
    int exit_status,
    double elapsed_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "checker_invocation";
    fields["source"] = truncate_source(source);
    fields["checker_path"] = checker_path;
    fields["result"] = result_kind;
    fields["exit_status"] = std::to_string(exit_status);
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    log(LogLevel::DEBUG, "Formula checker invoked", fields);
}

void Logger::log_eviction(size_t size_before, size_t size_after, size_t max_size) {
    std::map<std::string, std::string> fields;
    fields["event"] = "cache_eviction";
    fields["size_before"] = std::to_string(size_before);
    fields["size_after"] = std::to_string(size_after);
    fields["evicted"] = std::to_string(size_before - size_after);
    fields["max_size"] = std::to_string(max_size);

    log(LogLevel::INFO, "Formula cache trimmed", fields);
}

void Logger::log_path_change(const std::string& old_path, const std::string& new_path) {
    std::map<std::string, std::string> fields;
    fields["event"] = "checker_path_change";
    fields["old_path"] = old_path;
    fields["new_path"] = new_path;

    log(LogLevel::INFO, "Formula checker path changed", fields);
}

void Logger::log_error(
    const std::string& component,
    const std::string& error_message,
    const std::string& source
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["component"] = component;
    fields["error_message"] = error_message;

    if (!source.empty()) {
        fields["source"] = truncate_source(source);
    }

    log(LogLevel::ERROR, error_message, fields);
}

void Logger::log_warning(const std::string& component, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["component"] = component;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::truncate_source(const std::string& source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (source.size() <= config_.max_source_chars) {
        return source;
    }

    // Never cut inside a multi-byte UTF-8 sequence
    size_t cut = config_.max_source_chars;
    while (cut > 0 && (static_cast<unsigned char>(source[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return source.substr(0, cut) + "...";
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    // Escape control characters
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace mfnf
