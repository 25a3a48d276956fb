#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <sstream>
#include "code_executor.hpp"
#include "config_parser.hpp"
#include "execution_types.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

using namespace liverun;

namespace {

struct CLIArgs {
    std::string config_path;
    std::string language;
    std::string code_path;
    std::string inline_code;
    std::string request_path;      // JSON request document
    std::string session_id = "cli";
    std::vector<std::string> dependencies;
    uint32_t timeout_ms = 0;       // 0 = language default
    std::string output_path;
    std::string metrics_format;    // json or csv, printed to stderr after the run
    std::string parquet_path;
    std::string log_level;
    bool validate_only = false;
    bool preload = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "LiveRun Sandbox v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --language <id>             Language of the code (python, sql, json, markdown,\n";
    std::cerr << "                              regex, html, css)\n";
    std::cerr << "  --file <path>               Source file to run\n";
    std::cerr << "  --code <snippet>            Inline source to run (alternative to --file)\n";
    std::cerr << "  --request <path>            JSON request document {code, language, options}\n\n";
    std::cerr << "Execution options:\n";
    std::cerr << "  --config <path>             Sandbox configuration (default: built-in defaults)\n";
    std::cerr << "  --timeout <ms>              Timeout in milliseconds (default: language default)\n";
    std::cerr << "  --dependency <package>      Package to make importable first (repeatable)\n";
    std::cerr << "  --session <id>              Session id attached to logs (default: cli)\n";
    std::cerr << "  --validate                  Check syntax only, do not run\n";
    std::cerr << "  --preload                   Preload the configured engines before running\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             Result JSON file (default: stdout)\n";
    std::cerr << "  --metrics <json|csv>        Print collected metrics to stderr after the run\n";
    std::cerr << "  --parquet <path>            Write collected metrics to a Parquet file\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Run a Python file:\n";
    std::cerr << "     " << program_name << " --language python --file examples/hello.py\n\n";
    std::cerr << "  2. Run an inline SQL snippet with a custom configuration:\n";
    std::cerr << "     " << program_name << " --config config/sandbox.json --language sql \\\n";
    std::cerr << "         --code \"CREATE TABLE t (x INTEGER); INSERT INTO t VALUES (1); SELECT * FROM t;\"\n\n";
    std::cerr << "  3. Test a regular expression and dump metrics:\n";
    std::cerr << "     " << program_name << " --language regex --code \"\\d+|||a1b22|||g\" --metrics csv\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--language" && i + 1 < argc) {
            args.language = argv[++i];
        } else if (arg == "--file" && i + 1 < argc) {
            args.code_path = argv[++i];
        } else if (arg == "--code" && i + 1 < argc) {
            args.inline_code = argv[++i];
        } else if (arg == "--request" && i + 1 < argc) {
            args.request_path = argv[++i];
        } else if (arg == "--session" && i + 1 < argc) {
            args.session_id = argv[++i];
        } else if (arg == "--dependency" && i + 1 < argc) {
            args.dependencies.push_back(argv[++i]);
        } else if (arg == "--timeout" && i + 1 < argc) {
            args.timeout_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--metrics" && i + 1 < argc) {
            args.metrics_format = argv[++i];
        } else if (arg == "--parquet" && i + 1 < argc) {
            args.parquet_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--validate") {
            args.validate_only = true;
        } else if (arg == "--preload") {
            args.preload = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    int sources = (args.code_path.empty() ? 0 : 1) + (args.inline_code.empty() ? 0 : 1) +
                  (args.request_path.empty() ? 0 : 1);
    if (sources == 0) {
        std::cerr << "Error: Must provide one of --file, --code or --request\n";
        valid = false;
    } else if (sources > 1) {
        std::cerr << "Error: --file, --code and --request are mutually exclusive\n";
        valid = false;
    }

    if (args.request_path.empty() && args.language.empty()) {
        std::cerr << "Error: --language is required (or use --request)\n";
        valid = false;
    }

    if (!args.code_path.empty() && !file_exists(args.code_path)) {
        std::cerr << "Error: Source file not found: " << args.code_path << "\n";
        valid = false;
    }
    if (!args.request_path.empty() && !file_exists(args.request_path)) {
        std::cerr << "Error: Request file not found: " << args.request_path << "\n";
        valid = false;
    }
    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }
    if (!args.metrics_format.empty() && args.metrics_format != "json" && args.metrics_format != "csv") {
        std::cerr << "Error: --metrics must be json or csv\n";
        valid = false;
    }

    return valid;
}

ExecutionRequest build_request(const CLIArgs& args) {
    ExecutionRequest request;
    if (!args.request_path.empty()) {
        request = request_from_json(json::parse(read_file(args.request_path)));
    } else {
        request.code = args.code_path.empty() ? args.inline_code : read_file(args.code_path);
        request.language = args.language;
    }

    // Command-line values override the request document
    if (!args.language.empty()) request.language = args.language;
    if (request.session_id.empty() || args.session_id != "cli") request.session_id = args.session_id;
    if (args.timeout_ms > 0) request.options.timeout_ms = args.timeout_ms;
    for (const auto& dependency : args.dependencies) {
        request.options.dependencies.insert(dependency);
    }
    return request;
}

void write_output(const CLIArgs& args, const json& document) {
    if (args.output_path.empty()) {
        std::cout << document.dump(2) << std::endl;
        return;
    }
    std::ofstream out(args.output_path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + args.output_path);
    }
    out << document.dump(2) << std::endl;
    std::cerr << "Result written to: " << args.output_path << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    try {
        SandboxConfig config = args.config_path.empty()
            ? SandboxConfig()
            : parse_sandbox_config_from_file(args.config_path);
        if (!args.log_level.empty()) {
            config.logging.min_level = string_to_level(args.log_level);
        }
        if (!args.preload) {
            config.cache.preload.clear();
        }
        Logger::get_instance().configure(config.logging);

        ExecutionRequest request = build_request(args);

        CodeExecutor executor(config);
        for (const auto& failure : executor.start()) {
            std::cerr << "Warning: Preload of " << failure.first << " failed: " << failure.second << "\n";
        }

        int exit_code = 0;
        if (args.validate_only) {
            CodeValidation validation = executor.validate_code(request.code, request.language);
            write_output(args, to_json(validation));
            exit_code = validation.valid ? 0 : 2;
        } else {
            ExecutionResult result = executor.execute(request);
            write_output(args, to_json(result));
            exit_code = result.success ? 0 : 2;
        }

        executor.shutdown();

        if (!args.metrics_format.empty()) {
            std::cerr << executor.metrics().export_metrics(args.metrics_format) << "\n";
        }
        if (!args.parquet_path.empty()) {
            executor.metrics().export_parquet(args.parquet_path);
            std::cerr << "Metrics written to: " << args.parquet_path << "\n";
        }

        return exit_code;

    } catch (const ValidationError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const ConfigParseError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
