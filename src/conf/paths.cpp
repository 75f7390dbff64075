// conf/paths.cpp - Path expansion implementation
#include "paths.hpp"
#include "../core/error.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <cctype>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace converge {

static const std::string LOCATIONS_PREFIX = "locations.";

static std::string env_or_empty(const char *name) {
  const char *v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static bool is_var_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static std::string
expand_once(const std::string &raw,
            const std::map<std::string, std::string> &locations,
            const std::string &origin) {
  std::string in = raw;
  if (in == "~" || (in.size() >= 2 && in[0] == '~' && in[1] == '/')) {
    in = home_dir().string() + in.substr(1);
  }

  std::string out;
  size_t i = 0;
  while (i < in.size()) {
    if (in[i] != '$') {
      out += in[i++];
      continue;
    }

    if (i + 1 < in.size() && in[i + 1] == '{') {
      size_t close = in.find('}', i + 2);
      if (close == std::string::npos) {
        out += in.substr(i);
        break;
      }
      std::string name = in.substr(i + 2, close - i - 2);
      if (starts_with(name, LOCATIONS_PREFIX)) {
        std::string loc = name.substr(LOCATIONS_PREFIX.size());
        auto it = locations.find(loc);
        if (it == locations.end()) {
          throw Error::invalid_config(origin, "unknown location '" + loc + "'");
        }
        out += it->second;
      } else if (const char *v = std::getenv(name.c_str())) {
        out += v;
      } else {
        out += in.substr(i, close - i + 1);
      }
      i = close + 1;
      continue;
    }

    size_t end = i + 1;
    while (end < in.size() && is_var_char(in[end]))
      end++;
    std::string name = in.substr(i + 1, end - i - 1);
    const char *v = name.empty() ? nullptr : std::getenv(name.c_str());
    if (v) {
      out += v;
    } else {
      out += in.substr(i, end - i);
    }
    i = end;
  }
  return out;
}

std::string expand_path(const std::string &raw,
                        const std::map<std::string, std::string> &locations) {
  std::string current = raw;
  for (int depth = 0; depth <= MAX_EXPANSION_DEPTH; ++depth) {
    std::string next = expand_once(current, locations, raw);
    if (next == current)
      return current;
    current = next;
  }
  throw Error::invalid_config(raw, "location expansion too deep");
}

fs::path home_dir() {
  std::string home = env_or_empty("HOME");
  if (!home.empty())
    return home;
  if (struct passwd *pw = getpwuid(getuid())) {
    if (pw->pw_dir)
      return pw->pw_dir;
  }
  return "/";
}

fs::path config_dir() {
  std::string dir = env_or_empty(ENV_CONFIG_DIR);
  if (!dir.empty())
    return dir;
  std::string xdg = env_or_empty("XDG_CONFIG_HOME");
  if (!xdg.empty())
    return fs::path(xdg) / PROGRAM_NAME;
  return home_dir() / ".config" / PROGRAM_NAME;
}

fs::path state_dir() {
  std::string dir = env_or_empty(ENV_STATE_DIR);
  if (!dir.empty())
    return dir;
  std::string xdg = env_or_empty("XDG_STATE_HOME");
  if (!xdg.empty())
    return fs::path(xdg) / PROGRAM_NAME;
  return home_dir() / ".local" / "state" / PROGRAM_NAME;
}

fs::path default_config_path() { return config_dir() / CONFIG_FILENAME; }

} // namespace converge
