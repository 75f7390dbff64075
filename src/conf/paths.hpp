// conf/paths.hpp - Path expansion and well-known directories
#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace fs = std::filesystem;

namespace converge {

// Expands ~, $VAR, ${VAR} and ${locations.NAME} until nothing changes.
// Unknown environment variables are kept verbatim; unknown locations and
// reference cycles throw InvalidConfig.
std::string expand_path(const std::string &raw,
                        const std::map<std::string, std::string> &locations);

fs::path home_dir();
fs::path config_dir();
fs::path state_dir();
fs::path default_config_path();

} // namespace converge
