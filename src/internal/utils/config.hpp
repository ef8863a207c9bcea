// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Command Line Configuration                                       ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "sqlparse/types.hpp"

#include <string>
#include <vector>

namespace sqlparse {

/// Settings of the sqlparse tool, filled from the command line and an
/// optional key=value file
struct AppConfig {
    // Input
    std::vector<std::string> statements;
    std::string input_file;
    std::string config_file;

    // Output
    std::string output = "text";
    bool keep_going = false;

    // Logging settings
    std::string log_file;
    std::string log_level = "warn";

    // Keys in the loaded file that are not recognized, in file order
    std::vector<std::string> unknown_keys;

    /// Read `key = value` lines; '#' and ';' start comment lines.
    /// Recognized keys: log_level, log_file, output, keep_going.
    [[nodiscard]] Status load_from_file(const std::string& path);
};

/// Statements from `path`, one per line; blank lines and '#' comments are skipped
[[nodiscard]] Result<std::vector<std::string>> read_statements(const std::string& path);

} // namespace sqlparse
