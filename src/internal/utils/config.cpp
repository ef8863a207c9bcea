// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Command Line Configuration Implementation                        ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "internal/utils/config.hpp"

#include <fmt/core.h>

#include <filesystem>
#include <fstream>
#include <utility>

namespace sqlparse {

namespace {

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

} // anonymous namespace

Status AppConfig::load_from_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return Err(ErrorCode::InvalidArgument, fmt::format("config file '{}' does not exist", path));
    }

    std::ifstream file(path);
    if (!file) {
        return Err(ErrorCode::InvalidArgument, fmt::format("cannot open config file '{}'", path));
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) continue;

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        trim(key);
        trim(value);

        if (key == "log_level") log_level = value;
        else if (key == "log_file") log_file = value;
        else if (key == "output") output = value;
        else if (key == "keep_going") keep_going = (value == "true" || value == "1");
        else unknown_keys.push_back(key);
    }

    return Ok();
}

Result<std::vector<std::string>> read_statements(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<std::vector<std::string>>(ErrorCode::InvalidArgument,
                                             fmt::format("cannot read statements from '{}'", path));
    }

    std::vector<std::string> statements;
    std::string line;
    while (std::getline(file, line)) {
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;
        statements.push_back(line);
    }
    return Ok(std::move(statements));
}

} // namespace sqlparse
