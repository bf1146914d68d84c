#include <iostream>
#include <string>
#include <vector>
#include "config/checker_config.hpp"
#include "document/element_json.hpp"
#include "document/plain_text.hpp"
#include "logging/logger.hpp"
#include "tex/cached_tex_checker.hpp"
#include "util/make_filename.hpp"

namespace {

struct CLIArgs {
    std::string command;
    std::vector<std::string> operands;
    std::string config_path;
    std::string texvccheck_path;  // overrides config/environment when set
    std::string log_level;
    long long cache_size = -1;    // -1 = keep configured value
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "mfnf-util v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " <command> [options] <operands>...\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  make-filename <name>...     Print make-safe versions of file names\n";
    std::cerr << "  plain-text <tree.json>      Print the plain text of a parsed document\n";
    std::cerr << "  check-formula <formula>...  Check TeX formulas with texvccheck\n\n";
    std::cerr << "check-formula options:\n";
    std::cerr << "  --texvccheck <path>         Checker executable (default: texvccheck)\n";
    std::cerr << "  --config <path>             JSON configuration file\n";
    std::cerr << "  --cache-size <n>            Formula cache capacity (default: 10000)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Environment:\n";
    std::cerr << "  MFNF_TEXVCCHECK_PATH, MFNF_TEX_CACHE_SIZE, MFNF_LOG_LEVEL\n\n";
    std::cerr << "Exit status of check-formula: 0 if every formula is valid, 1 otherwise,\n";
    std::cerr << "2 if the checker could not be run.\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--texvccheck" && i + 1 < argc) {
            args.texvccheck_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--cache-size" && i + 1 < argc) {
            args.cache_size = std::stoll(argv[++i]);
            if (args.cache_size < 0) {
                std::cerr << "Error: --cache-size must not be negative\n\n";
                return false;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--") {
            for (++i; i < argc; ++i) {
                args.operands.push_back(argv[i]);
            }
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.operands.push_back(arg);
        }
    }
    return true;
}

int run_make_filename(const CLIArgs& args) {
    for (const auto& name : args.operands) {
        std::cout << mfnf::filename_to_make(name) << "\n";
    }
    return 0;
}

int run_plain_text(const CLIArgs& args) {
    if (args.operands.size() != 1) {
        std::cerr << "Error: plain-text expects exactly one document file\n";
        return 2;
    }

    mfnf::document::Element root = mfnf::document::parse_document_from_file(args.operands[0]);
    std::cout << mfnf::document::extract_plain_text(root.content) << "\n";
    return 0;
}

int run_check_formula(const CLIArgs& args, const mfnf::CheckerConfig& config) {
    mfnf::tex::CachedTexChecker checker(config.texvccheck_path, config.cache_size);

    bool all_valid = true;
    for (const auto& source : args.operands) {
        mfnf::tex::TexResult result = checker.check(source);
        all_valid = all_valid && result.is_valid();

        std::cout << mfnf::tex::format_result_line(source, result) << "\n";
    }

    return all_valid ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid option value: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 2;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.command.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        mfnf::CheckerConfig config = mfnf::load_checker_config(args.config_path);
        if (!args.texvccheck_path.empty()) {
            config.texvccheck_path = args.texvccheck_path;
        }
        if (args.cache_size >= 0) {
            config.cache_size = static_cast<size_t>(args.cache_size);
        }
        if (!args.log_level.empty()) {
            config.log_level = mfnf::parse_log_level(args.log_level);
        }
        mfnf::Logger::get_instance().configure(mfnf::make_logger_config(config));

        if (args.command == "make-filename") {
            return run_make_filename(args);
        } else if (args.command == "plain-text") {
            return run_plain_text(args);
        } else if (args.command == "check-formula") {
            return run_check_formula(args, config);
        }

        std::cerr << "Error: Unknown command: " << args.command << "\n\n";
        print_usage(argv[0]);
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
