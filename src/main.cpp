// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Command Line Front End                                           ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

// Third-party includes
#include <CLI/CLI.hpp>
#include <fmt/color.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

// Project includes
#include "sqlparse/json.hpp"
#include "sqlparse/sqlparse.hpp"
#include "internal/utils/config.hpp"
#include "internal/utils/logger.hpp"

namespace {

constexpr int EXIT_PARSE_FAILURE = 1;
constexpr int EXIT_USAGE = 2;

void print_text(const sqlparse::Parser& parser, const sqlparse::Status& status) {
    if (status) {
        fmt::print("{}\n", parser.query().to_string());
        return;
    }
    fmt::print(stderr, fg(fmt::color::red), "error: ");
    fmt::print(stderr, "{}\n", status.error().to_string());
    fmt::print(stderr, "{}\n", parser.diagnostic(status.error()));
}

nlohmann::json to_json_entry(const sqlparse::Parser& parser, const sqlparse::Status& status) {
    nlohmann::json entry;
    entry["statement"] = parser.sql();
    entry["ok"] = status.has_value();
    if (status) {
        entry["query"] = parser.query();
    } else {
        entry["error"] = status.error();
    }
    return entry;
}

// ============================================================================
// Main Application Logic
// ============================================================================
int run_application(const sqlparse::AppConfig& config) {
    std::vector<std::string> statements = config.statements;
    if (!config.input_file.empty()) {
        auto from_file = sqlparse::read_statements(config.input_file);
        if (!from_file) {
            sqlparse::Logger::error("{}", from_file.error().message());
            fmt::print(stderr, "{}\n", from_file.error().message());
            return EXIT_USAGE;
        }
        statements.insert(statements.end(), from_file->begin(), from_file->end());
    }

    if (statements.empty()) {
        fmt::print(stderr, "No statements given (pass them as arguments or with --file)\n");
        return EXIT_USAGE;
    }

    const bool json = config.output == "json";
    nlohmann::json results = nlohmann::json::array();
    std::size_t failures = 0;

    for (const auto& statement : statements) {
        sqlparse::Parser parser(statement);
        auto status = parser.parse();

        if (json) {
            results.push_back(to_json_entry(parser, status));
        } else {
            print_text(parser, status);
        }

        if (!status) {
            ++failures;
            if (!config.keep_going) {
                break;
            }
        }
    }

    if (json) {
        // Statements from a Latin-1 file are not valid UTF-8
        fmt::print("{}\n", results.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    sqlparse::Logger::info("Parsed {} statement(s), {} failed", statements.size(), failures);
    return failures == 0 ? EXIT_SUCCESS : EXIT_PARSE_FAILURE;
}

} // anonymous namespace

// ============================================================================
// Entry Point
// ============================================================================
int main(int argc, char* argv[]) {
    sqlparse::AppConfig config;

    CLI::App app{"sqlparse - parse SQL-subset statements into a query AST"};

    app.add_option("statements", config.statements,
        "Statements to parse, one per argument");

    app.add_option("-f,--file", config.input_file,
        "Read statements from a file, one per line")
        ->check(CLI::ExistingFile);

    app.add_option("-c,--config", config.config_file,
        "Configuration file path")
        ->envname("SQLPARSE_CONFIG");

    app.add_option("-o,--output", config.output,
        "Output format (text/json)")
        ->check(CLI::IsMember({"text", "json"}));

    app.add_flag_callback("--json", [&config]() {
        config.output = "json";
    }, "Shorthand for --output json");

    app.add_flag("-k,--keep-going,!--fail-fast", config.keep_going,
        "Parse every statement instead of stopping at the first failure");

    // Logging options
    app.add_option("-l,--log-level", config.log_level,
        "Log level (trace/debug/info/warn/error/off)")
        ->envname("SQLPARSE_LOG_LEVEL");

    app.add_option("--log-file", config.log_file,
        "Log file path")
        ->envname("SQLPARSE_LOG_FILE");

    app.add_flag_callback("--version", []() {
        std::cout << "sqlparse version " << SQLPARSE_VERSION << std::endl;
        std::cout << "Build type: " << SQLPARSE_BUILD_TYPE << std::endl;
        std::cout << "Compiler: " << SQLPARSE_COMPILER << std::endl;
        std::exit(0);
    }, "Show version information");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? EXIT_SUCCESS : EXIT_USAGE;
    }

    // Config file values apply only where the command line was silent
    if (!config.config_file.empty()) {
        sqlparse::AppConfig file_config;
        if (auto status = file_config.load_from_file(config.config_file); !status) {
            std::cerr << "Failed to load config: " << status.error().message() << std::endl;
            return EXIT_USAGE;
        }
        config.unknown_keys = std::move(file_config.unknown_keys);
        if (app.count("--log-level") == 0) config.log_level = file_config.log_level;
        if (app.count("--log-file") == 0) config.log_file = file_config.log_file;
        if (app.count("--output") == 0 && app.count("--json") == 0) config.output = file_config.output;
        if (app.count("--keep-going") == 0) config.keep_going = file_config.keep_going;
    }

    if (config.output != "text" && config.output != "json") {
        std::cerr << "Unknown output format: " << config.output << std::endl;
        return EXIT_USAGE;
    }

    sqlparse::Logger::init(config.log_file, sqlparse::Logger::level_from_string(config.log_level));
    sqlparse::Logger::debug("sqlparse v{} ({} build)", sqlparse::VERSION_STRING, sqlparse::BUILD_TYPE);
    for (const auto& key : config.unknown_keys) {
        sqlparse::Logger::warn("Unknown config key '{}' in {}", key, config.config_file);
    }

    int code = run_application(config);
    sqlparse::Logger::shutdown();
    return code;
}
