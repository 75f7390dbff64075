// Constants and definitions
#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace converge {

constexpr const char *PROGRAM_NAME = "converge";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *LOG_FILENAME = "converge.log";

// Environment overrides
constexpr const char *ENV_CONFIG_DIR = "CONVERGE_CONFIG_DIR";
constexpr const char *ENV_STATE_DIR = "CONVERGE_STATE_DIR";

// External tools
constexpr const char *TOOL_BREW = "brew";
constexpr const char *TOOL_MAS = "mas";
constexpr const char *TOOL_PNPM = "pnpm";
constexpr const char *TOOL_CODE = "code";
constexpr const char *TOOL_GH = "gh";
constexpr const char *TOOL_DEFAULTS = "defaults";
constexpr const char *TOOL_DUTI = "duti";
constexpr const char *TOOL_DOCKUTIL = "dockutil";
constexpr const char *TOOL_KILLALL = "killall";
constexpr const char *TOOL_SUDO = "sudo";

// Resource kind identifiers (user visible)
constexpr const char *KIND_FORMULA = "formula";
constexpr const char *KIND_CASK = "cask";
constexpr const char *KIND_TAP = "tap";
constexpr const char *KIND_STORE_APP = "store-app";
constexpr const char *KIND_EDITOR_EXTENSION = "editor-extension";
constexpr const char *KIND_CLI_EXTENSION = "cli-extension";
constexpr const char *KIND_NODE_GLOBAL = "node-global";
constexpr const char *KIND_PREFERENCE = "preference";
constexpr const char *KIND_SYMLINK = "symlink";
constexpr const char *KIND_SERVICE = "service";
constexpr const char *KIND_FILE_HANDLER = "file-handler";
constexpr const char *KIND_DOCK_APP = "dock-app";
constexpr const char *KIND_DOCK_FOLDER = "dock-folder";

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_RESOURCE_FAILURE = 1;
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_PRIVILEGE_REFUSED = 3;

// Defaults
constexpr std::size_t DEFAULT_JOBS = 4;
constexpr std::uint32_t DEFAULT_RETRY_ATTEMPTS = 3;
constexpr std::uint32_t DEFAULT_RETRY_DELAY_MS = 2000;
constexpr std::uint32_t MAX_RETRY_DELAY_MS = 60000;
constexpr int MAX_EXPANSION_DEPTH = 8;
constexpr std::size_t STDERR_TAIL_LINES = 5;

// Preference domains whose changes need the owning process restarted
const std::map<std::string, std::string> BUILTIN_DOMAIN_SERVICES = {
    {"com.apple.finder", "Finder"},
    {"com.apple.dock", "Dock"},
    {"com.apple.systemuiserver", "SystemUIServer"}};

} // namespace converge
