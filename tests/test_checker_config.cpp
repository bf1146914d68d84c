#include <catch2/catch.hpp>
#include "config/checker_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace mfnf;
namespace fs = std::filesystem;

namespace {

// Sets an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~EnvGuard() { unsetenv(name_); }

private:
    const char* name_;
};

std::string write_config(const std::string& name, const std::string& content) {
    fs::path dir = fs::temp_directory_path() / ("mfnf_config_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    fs::path path = dir / name;
    std::ofstream f(path);
    f << content;
    return path.string();
}

} // namespace

TEST_CASE("CheckerConfig: Defaults", "[config]") {
    CheckerConfig config;

    REQUIRE(config.texvccheck_path == "texvccheck");
    REQUIRE(config.cache_size == 10000);
    REQUIRE(config.log_level == LogLevel::INFO);
    REQUIRE(config.log_json == true);
    REQUIRE(config.log_file.empty());
}

TEST_CASE("CheckerConfig: Parse from string", "[config]") {
    SECTION("All fields") {
        CheckerConfig config = parse_checker_config_from_string(R"({
            "texvccheck_path": "/opt/texvc/texvccheck",
            "cache_size": 500,
            "log_level": "DEBUG",
            "log_json": false,
            "log_file": "/var/log/texcheck.log"
        })");

        REQUIRE(config.texvccheck_path == "/opt/texvc/texvccheck");
        REQUIRE(config.cache_size == 500);
        REQUIRE(config.log_level == LogLevel::DEBUG);
        REQUIRE(config.log_json == false);
        REQUIRE(config.log_file == "/var/log/texcheck.log");
    }

    SECTION("Missing fields keep the base values") {
        CheckerConfig base;
        base.cache_size = 7;
        CheckerConfig config = parse_checker_config_from_string(R"({"log_level": "WARN"})", base);

        REQUIRE(config.cache_size == 7);
        REQUIRE(config.texvccheck_path == "texvccheck");
        REQUIRE(config.log_level == LogLevel::WARN);
    }

    SECTION("Environment references are expanded") {
        EnvGuard guard("MFNF_TEST_TEXVC_HOME", "/srv/texvc");
        CheckerConfig config = parse_checker_config_from_string(
            R"({"texvccheck_path": "${MFNF_TEST_TEXVC_HOME}/bin/texvccheck"})");

        REQUIRE(config.texvccheck_path == "/srv/texvc/bin/texvccheck");
    }
}

TEST_CASE("CheckerConfig: Invalid values are rejected", "[config]") {
    REQUIRE_THROWS_AS(parse_checker_config_from_string("{broken"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_checker_config_from_string("[1, 2]"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_checker_config_from_string(R"({"cache_size": -1})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_checker_config_from_string(R"({"cache_size": "big"})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_checker_config_from_string(R"({"log_level": "LOUD"})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_checker_config_from_string(R"({"log_json": "yes"})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_checker_config_from_string(R"({"texvccheck_path": ""})"), ConfigParseError);
}

TEST_CASE("CheckerConfig: Parse from file", "[config]") {
    SECTION("Relative checker paths are resolved against the config directory") {
        std::string path = write_config("relative.json",
            R"({"texvccheck_path": "bin/texvccheck", "log_file": "check.log"})");
        CheckerConfig config = parse_checker_config_from_file(path);

        fs::path dir = fs::path(path).parent_path();
        REQUIRE(config.texvccheck_path == (dir / "bin/texvccheck").string());
        REQUIRE(config.log_file == (dir / "check.log").string());
    }

    SECTION("Bare command names are left for PATH lookup") {
        std::string path = write_config("bare.json", R"({"texvccheck_path": "texvccheck-2"})");
        CheckerConfig config = parse_checker_config_from_file(path);

        REQUIRE(config.texvccheck_path == "texvccheck-2");
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(parse_checker_config_from_file("/nonexistent/mfnf.json"), ConfigParseError);
    }
}

TEST_CASE("CheckerConfig: Environment overrides the config file", "[config]") {
    std::string path = write_config("layered.json",
        R"({"texvccheck_path": "/from/file", "cache_size": 100, "log_level": "ERROR"})");

    SECTION("File values without environment") {
        CheckerConfig config = load_checker_config(path);
        REQUIRE(config.texvccheck_path == "/from/file");
        REQUIRE(config.cache_size == 100);
        REQUIRE(config.log_level == LogLevel::ERROR);
    }

    SECTION("Environment wins") {
        EnvGuard path_guard("MFNF_TEXVCCHECK_PATH", "/from/env");
        EnvGuard size_guard("MFNF_TEX_CACHE_SIZE", "42");
        EnvGuard level_guard("MFNF_LOG_LEVEL", "DEBUG");

        CheckerConfig config = load_checker_config(path);
        REQUIRE(config.texvccheck_path == "/from/env");
        REQUIRE(config.cache_size == 42);
        REQUIRE(config.log_level == LogLevel::DEBUG);
    }

    SECTION("Invalid environment values") {
        EnvGuard size_guard("MFNF_TEX_CACHE_SIZE", "lots");
        REQUIRE_THROWS_AS(load_checker_config(path), ConfigParseError);
    }

    SECTION("No config file means defaults") {
        CheckerConfig config = load_checker_config();
        REQUIRE(config.cache_size == CheckerConfig().cache_size);
    }
}

TEST_CASE("CheckerConfig: Logger configuration", "[config]") {
    CheckerConfig config;
    config.log_level = LogLevel::WARN;
    config.log_json = false;

    LoggerConfig console_only = make_logger_config(config);
    REQUIRE(console_only.min_level == LogLevel::WARN);
    REQUIRE(console_only.enable_json == false);
    REQUIRE(console_only.enable_file == false);

    config.log_file = "/tmp/texcheck.log";
    LoggerConfig with_file = make_logger_config(config);
    REQUIRE(with_file.enable_file == true);
    REQUIRE(with_file.log_file_path == "/tmp/texcheck.log");
}

TEST_CASE("expand_environment_variables: Syntax forms", "[config]") {
    EnvGuard guard("MFNF_TEST_VAR", "value");

    REQUIRE(expand_environment_variables("${MFNF_TEST_VAR}/x") == "value/x");
    REQUIRE(expand_environment_variables("$MFNF_TEST_VAR/x") == "value/x");
    REQUIRE(expand_environment_variables("${MFNF_TEST_UNSET_VAR}x") == "x");
    REQUIRE(expand_environment_variables("cost: 5 $") == "cost: 5 $");
    REQUIRE(expand_environment_variables("no variables") == "no variables");
}
