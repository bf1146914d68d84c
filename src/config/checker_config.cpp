#include "config/checker_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <filesystem>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace mfnf {

namespace {

size_t parse_cache_size(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigParseError("Invalid cache size: '" + value + "'");
    }
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw ConfigParseError("Cache size out of range: " + value);
    }
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    if (name == "DEBUG" || name == "INFO" || name == "WARN" || name == "ERROR") {
        return string_to_level(name);
    }
    throw ConfigParseError("Invalid log level: '" + name + "' (expected DEBUG, INFO, WARN or ERROR)");
}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Extract variable name
        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (var_name.empty()) {
            // Lone '$', keep it literally
            pos = start + 1;
            continue;
        }

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++; // Skip '}'
        }

        // Get environment variable value
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

CheckerConfig parse_checker_config_from_string(const std::string& json_string, const CheckerConfig& base) {
    CheckerConfig config = base;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigParseError("Config root must be a JSON object");
        }

        if (j.contains("texvccheck_path")) {
            config.texvccheck_path = expand_environment_variables(
                j["texvccheck_path"].get<std::string>()
            );
            if (config.texvccheck_path.empty()) {
                throw ConfigParseError("texvccheck_path must not be empty");
            }
        }

        if (j.contains("cache_size")) {
            if (!j["cache_size"].is_number_unsigned()) {
                throw ConfigParseError("cache_size must be a non-negative integer");
            }
            config.cache_size = j["cache_size"].get<size_t>();
        }

        if (j.contains("log_level")) {
            config.log_level = parse_log_level(j["log_level"].get<std::string>());
        }

        if (j.contains("log_json")) {
            config.log_json = j["log_json"].get<bool>();
        }

        if (j.contains("log_file")) {
            config.log_file = expand_environment_variables(j["log_file"].get<std::string>());
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

CheckerConfig parse_checker_config_from_file(const std::string& file_path, const CheckerConfig& base) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    CheckerConfig config = parse_checker_config_from_string(buffer.str(), base);

    // Bare command names stay as they are so they are looked up on PATH
    if (config.texvccheck_path.find('/') != std::string::npos) {
        config.texvccheck_path = resolve_relative_path(config.texvccheck_path, file_path);
    }

    if (!config.log_file.empty()) {
        config.log_file = resolve_relative_path(config.log_file, file_path);
    }

    return config;
}

void apply_environment_overrides(CheckerConfig& config) {
    const char* path = std::getenv("MFNF_TEXVCCHECK_PATH");
    const char* cache_size = std::getenv("MFNF_TEX_CACHE_SIZE");
    const char* log_level = std::getenv("MFNF_LOG_LEVEL");

    if (path && *path) {
        config.texvccheck_path = path;
    }
    if (cache_size && *cache_size) {
        config.cache_size = parse_cache_size(cache_size);
    }
    if (log_level && *log_level) {
        config.log_level = parse_log_level(log_level);
    }
}

CheckerConfig load_checker_config(const std::string& config_file_path) {
    CheckerConfig config;

    if (!config_file_path.empty()) {
        config = parse_checker_config_from_file(config_file_path, config);
    }

    apply_environment_overrides(config);
    return config;
}

LoggerConfig make_logger_config(const CheckerConfig& config) {
    LoggerConfig logger_config;
    logger_config.min_level = config.log_level;
    logger_config.enable_json = config.log_json;

    if (!config.log_file.empty()) {
        logger_config.enable_file = true;
        logger_config.log_file_path = config.log_file;
    }

    return logger_config;
}

} // namespace mfnf
