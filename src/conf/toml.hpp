// conf/toml.hpp - TOML subset reader for the configuration document
#pragma once

#include "../core/json.hpp"
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace converge {

// Supports tables, arrays of tables, dotted keys, basic and literal strings,
// integers, floats, booleans, arrays (may span lines) and inline tables.
// Tables become json objects. Throws InvalidConfig{where="line N"}.
json::Value parse_toml(const std::string &text);
json::Value parse_toml_file(const fs::path &path);

} // namespace converge
