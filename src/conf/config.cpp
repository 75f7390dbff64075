// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../core/error.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "paths.hpp"
#include "toml.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace converge {

// PreferenceValue

const char *preference_type_name(PreferenceType type) {
  switch (type) {
  case PreferenceType::Bool:
    return "bool";
  case PreferenceType::Int:
    return "int";
  case PreferenceType::Float:
    return "float";
  case PreferenceType::String:
    return "string";
  }
  return "string";
}

PreferenceValue PreferenceValue::of_bool(bool v) {
  PreferenceValue p;
  p.type = PreferenceType::Bool;
  p.bool_value = v;
  return p;
}

PreferenceValue PreferenceValue::of_int(std::int64_t v) {
  PreferenceValue p;
  p.type = PreferenceType::Int;
  p.int_value = v;
  return p;
}

PreferenceValue PreferenceValue::of_float(double v) {
  PreferenceValue p;
  p.type = PreferenceType::Float;
  p.float_value = v;
  return p;
}

PreferenceValue PreferenceValue::of_string(const std::string &v) {
  PreferenceValue p;
  p.type = PreferenceType::String;
  p.string_value = v;
  return p;
}

bool PreferenceValue::parse(PreferenceType type, const std::string &raw,
                            PreferenceValue &out) {
  std::string text = trim(raw);
  try {
    switch (type) {
    case PreferenceType::Bool: {
      std::string lowered = to_lower(text);
      if (lowered == "1" || lowered == "true" || lowered == "yes") {
        out = of_bool(true);
        return true;
      }
      if (lowered == "0" || lowered == "false" || lowered == "no") {
        out = of_bool(false);
        return true;
      }
      return false;
    }
    case PreferenceType::Int: {
      std::size_t used = 0;
      long long v = std::stoll(text, &used);
      if (used != text.size())
        return false;
      out = of_int(v);
      return true;
    }
    case PreferenceType::Float: {
      std::size_t used = 0;
      double v = std::stod(text, &used);
      if (used != text.size())
        return false;
      out = of_float(v);
      return true;
    }
    case PreferenceType::String:
      out = of_string(text);
      return true;
    }
  } catch (const std::logic_error &) {
    // stoll/stod reject non-numeric or out-of-range text
    return false;
  }
  return false;
}

std::string PreferenceValue::canonical() const {
  switch (type) {
  case PreferenceType::Bool:
    return bool_value ? "true" : "false";
  case PreferenceType::Int:
    return std::to_string(int_value);
  case PreferenceType::Float: {
    std::ostringstream ss;
    ss << std::setprecision(15) << float_value;
    return ss.str();
  }
  case PreferenceType::String:
    return string_value;
  }
  return string_value;
}

const char *PreferenceValue::write_flag() const {
  switch (type) {
  case PreferenceType::Bool:
    return "-bool";
  case PreferenceType::Int:
    return "-int";
  case PreferenceType::Float:
    return "-float";
  case PreferenceType::String:
    return "-string";
  }
  return "-string";
}

Settings::Settings()
    : jobs(DEFAULT_JOBS), retry_attempts(DEFAULT_RETRY_ATTEMPTS),
      retry_delay_ms(DEFAULT_RETRY_DELAY_MS) {}

bool is_package_kind(const std::string &kind) {
  return kind == KIND_FORMULA || kind == KIND_CASK || kind == KIND_TAP ||
         kind == KIND_STORE_APP || kind == KIND_EDITOR_EXTENSION ||
         kind == KIND_CLI_EXTENSION || kind == KIND_NODE_GLOBAL;
}

// Document readers

static void warn_unknown_fields(const json::Value &table,
                                const std::set<std::string> &known,
                                const std::string &where) {
  for (const auto &key : table.keys()) {
    if (known.count(key) == 0) {
      LOG_WARN("Ignoring unknown field '" + key + "' in " + where);
    }
  }
}

static std::string require_string(const json::Value &table,
                                  const std::string &key,
                                  const std::string &where) {
  const json::Value *v = table.find(key);
  if (!v)
    throw Error::invalid_config(where, "missing required field '" + key + "'");
  if (!v->is_string())
    throw Error::invalid_config(where, "'" + key + "' must be a string");
  if (v->as_string().empty())
    throw Error::invalid_config(where, "'" + key + "' must not be empty");
  return v->as_string();
}

static std::string optional_string(const json::Value &table,
                                   const std::string &key,
                                   const std::string &where,
                                   const std::string &fallback = "") {
  const json::Value *v = table.find(key);
  if (!v)
    return fallback;
  if (!v->is_string())
    throw Error::invalid_config(where, "'" + key + "' must be a string");
  return v->as_string();
}

static bool optional_bool(const json::Value &table, const std::string &key,
                          const std::string &where) {
  const json::Value *v = table.find(key);
  if (!v)
    return false;
  if (!v->is_bool())
    throw Error::invalid_config(where, "'" + key + "' must be a boolean");
  return v->as_bool();
}

static std::vector<std::string> string_list(const json::Value &v,
                                            const std::string &where) {
  if (!v.is_array())
    throw Error::invalid_config(where, "expected a list of strings");
  std::vector<std::string> out;
  for (const auto &item : v.items()) {
    if (!item.is_string())
      throw Error::invalid_config(where, "expected a list of strings");
    out.push_back(item.as_string());
  }
  return out;
}

static const json::Value &table_list(const json::Value &doc,
                                     const std::string &key) {
  static const json::Value empty = json::Value::array();
  const json::Value *v = doc.find(key);
  if (!v)
    return empty;
  if (!v->is_array())
    throw Error::invalid_config(key, "expected a list of tables");
  return *v;
}

static std::string entry_where(const std::string &section, std::size_t index) {
  return section + "[" + std::to_string(index) + "]";
}

static PreferenceValue read_preference_value(const json::Value &table,
                                             const std::string &where) {
  const json::Value *v = table.find("value");
  if (!v)
    throw Error::invalid_config(where, "missing required field 'value'");

  std::string type = optional_string(table, "type", where);
  if (type.empty()) {
    if (v->is_bool())
      type = "bool";
    else if (v->is_integer())
      type = "int";
    else if (v->is_number())
      type = "float";
    else
      type = "string";
  }

  if (type == "bool") {
    if (v->is_bool())
      return PreferenceValue::of_bool(v->as_bool());
  } else if (type == "int") {
    if (v->is_integer())
      return PreferenceValue::of_int(v->as_int());
  } else if (type == "float") {
    if (v->is_number())
      return PreferenceValue::of_float(v->as_double());
  } else if (type == "string") {
    if (v->is_string())
      return PreferenceValue::of_string(v->as_string());
  } else {
    throw Error::invalid_config(where, "unknown preference type '" + type +
                                           "'");
  }
  throw Error::invalid_config(where, "value does not match type '" + type +
                                         "'");
}

static void read_settings(const json::Value &doc, Config &config) {
  const json::Value *settings = doc.find("settings");
  if (!settings)
    return;
  if (!settings->is_object())
    throw Error::invalid_config("settings", "expected a table");

  warn_unknown_fields(*settings,
                      {"jobs", "retry_attempts", "retry_delay_ms", "log_file"},
                      "settings");

  auto positive_int = [&](const std::string &key) -> std::int64_t {
    const json::Value *v = settings->find(key);
    if (!v->is_integer() || v->as_int() < 0)
      throw Error::invalid_config("settings." + key,
                                  "expected a non-negative integer");
    return v->as_int();
  };

  if (settings->contains("jobs")) {
    std::int64_t jobs = positive_int("jobs");
    if (jobs == 0)
      throw Error::invalid_config("settings.jobs", "must be at least 1");
    config.settings.jobs = static_cast<std::size_t>(jobs);
  }
  if (settings->contains("retry_attempts")) {
    config.settings.retry_attempts =
        static_cast<std::uint32_t>(positive_int("retry_attempts"));
  }
  if (settings->contains("retry_delay_ms")) {
    config.settings.retry_delay_ms =
        static_cast<std::uint32_t>(positive_int("retry_delay_ms"));
  }
  std::string log_file = optional_string(*settings, "log_file", "settings");
  if (!log_file.empty()) {
    config.settings.log_file = expand_path(log_file, config.locations);
  }
}

static void read_services(const json::Value &doc, Config &config) {
  const json::Value *services = doc.find("services");
  if (!services)
    return;
  if (!services->is_array())
    throw Error::invalid_config("services", "expected a list");

  for (std::size_t i = 0; i < services->size(); ++i) {
    const json::Value &item = (*services)[i];
    std::string where = entry_where("services", i);
    ServiceEntry entry;
    if (item.is_string()) {
      entry.name = item.as_string();
    } else if (item.is_object()) {
      warn_unknown_fields(item, {"name", "domains"}, where);
      entry.name = require_string(item, "name", where);
      if (const json::Value *domains = item.find("domains")) {
        entry.domains = string_list(*domains, where + ".domains");
      }
    } else {
      throw Error::invalid_config(where, "expected a name or a table");
    }
    if (entry.name.empty())
      throw Error::invalid_config(where, "service name must not be empty");
    config.services.push_back(entry);
  }
}

static void read_dock(const json::Value &doc, Config &config) {
  const json::Value *dock = doc.find("dock");
  if (!dock)
    return;
  if (!dock->is_object())
    throw Error::invalid_config("dock", "expected a table");
  warn_unknown_fields(*dock, {"apps", "folders"}, "dock");

  if (const json::Value *apps = dock->find("apps")) {
    for (const auto &app : string_list(*apps, "dock.apps")) {
      config.dock.apps.push_back(expand_path(app, config.locations));
    }
  }

  const json::Value *folders = dock->find("folders");
  if (!folders)
    return;
  if (!folders->is_array())
    throw Error::invalid_config("dock.folders", "expected a list");
  for (std::size_t i = 0; i < folders->size(); ++i) {
    const json::Value &item = (*folders)[i];
    std::string where = entry_where("dock.folders", i);
    DockFolderEntry entry;
    if (item.is_string()) {
      entry.path = expand_path(item.as_string(), config.locations);
    } else if (item.is_object()) {
      warn_unknown_fields(item, {"path", "view", "display", "sort"}, where);
      entry.path =
          expand_path(require_string(item, "path", where), config.locations);
      entry.view = optional_string(item, "view", where, entry.view);
      entry.display = optional_string(item, "display", where, entry.display);
      entry.sort = optional_string(item, "sort", where, entry.sort);
    } else {
      throw Error::invalid_config(where, "expected a path or a table");
    }
    config.dock.folders.push_back(entry);
  }
}

// Config

Config Config::load_default() { return from_file(default_config_path()); }

Config Config::from_file(const fs::path &path) {
  if (!fs::exists(path)) {
    throw Error::invalid_config(path.string(), "configuration file not found");
  }
  LOG_DEBUG("Loading configuration from " + path.string());
  Config config = from_document(parse_toml_file(path), path.string());
  config.source_path = path;
  return config;
}

Config Config::from_toml(const std::string &text, const std::string &origin) {
  return from_document(parse_toml(text), origin);
}

Config Config::from_document(const json::Value &doc,
                             const std::string &origin) {
  Config config;

  static const std::set<std::string> known_sections = {
      "locations",     "packages",      "preferences", "symlinks",
      "services",      "privilege_allowlist", "file_handlers", "dock",
      "settings"};
  warn_unknown_fields(doc, known_sections, origin);

  // Locations first: every path field below may reference them
  if (const json::Value *locations = doc.find("locations")) {
    if (!locations->is_object())
      throw Error::invalid_config("locations", "expected a table");
    for (std::size_t i = 0; i < locations->keys().size(); ++i) {
      const std::string &name = locations->keys()[i];
      const json::Value &value = locations->items()[i];
      if (!value.is_string())
        throw Error::invalid_config("locations." + name, "expected a path");
      config.locations[name] = value.as_string();
    }
    for (auto &[name, value] : config.locations) {
      value = expand_path(value, config.locations);
    }
  }

  if (const json::Value *allow = doc.find("privilege_allowlist")) {
    if (!allow->is_object())
      throw Error::invalid_config("privilege_allowlist", "expected a table");
    warn_unknown_fields(*allow, {"packages", "preferences"},
                        "privilege_allowlist");
    if (const json::Value *pkgs = allow->find("packages")) {
      for (const auto &id :
           string_list(*pkgs, "privilege_allowlist.packages")) {
        config.allowlist.packages.insert(id);
      }
    }
    if (const json::Value *prefs = allow->find("preferences")) {
      for (const auto &id :
           string_list(*prefs, "privilege_allowlist.preferences")) {
        config.allowlist.preferences.insert(id);
      }
    }
  }

  const json::Value &packages = table_list(doc, "packages");
  for (std::size_t i = 0; i < packages.size(); ++i) {
    const json::Value &item = packages[i];
    std::string where = entry_where("packages", i);
    if (!item.is_object())
      throw Error::invalid_config(where, "expected a table");
    warn_unknown_fields(item, {"kind", "name", "version", "privileged"}, where);

    PackageEntry entry;
    entry.kind = require_string(item, "kind", where);
    if (!is_package_kind(entry.kind))
      throw Error::invalid_config(where, "unknown package kind '" +
                                             entry.kind + "'");
    entry.name = require_string(item, "name", where);
    entry.version = optional_string(item, "version", where);
    entry.privileged = optional_bool(item, "privileged", where);
    if (entry.privileged)
      config.allowlist.packages.insert(entry.name);
    entry.privileged = config.allowlist.packages.count(entry.name) > 0;
    config.packages.push_back(entry);
  }

  const json::Value &preferences = table_list(doc, "preferences");
  for (std::size_t i = 0; i < preferences.size(); ++i) {
    const json::Value &item = preferences[i];
    std::string where = entry_where("preferences", i);
    if (!item.is_object())
      throw Error::invalid_config(where, "expected a table");
    warn_unknown_fields(
        item, {"domain", "key", "type", "value", "privileged"}, where);

    PreferenceEntry entry;
    entry.domain = require_string(item, "domain", where);
    entry.key = require_string(item, "key", where);
    entry.value = read_preference_value(item, where);
    if (optional_bool(item, "privileged", where))
      config.allowlist.preferences.insert(entry.id());
    entry.privileged = config.allowlist.preferences.count(entry.id()) > 0;
    config.preferences.push_back(entry);
  }

  const json::Value &symlinks = table_list(doc, "symlinks");
  for (std::size_t i = 0; i < symlinks.size(); ++i) {
    const json::Value &item = symlinks[i];
    std::string where = entry_where("symlinks", i);
    if (!item.is_object())
      throw Error::invalid_config(where, "expected a table");
    warn_unknown_fields(item, {"source", "target", "force"}, where);

    SymlinkEntry entry;
    entry.source =
        expand_path(require_string(item, "source", where), config.locations);
    entry.target =
        expand_path(require_string(item, "target", where), config.locations);
    entry.force = optional_bool(item, "force", where);
    config.symlinks.push_back(entry);
  }

  read_services(doc, config);

  const json::Value &handlers = table_list(doc, "file_handlers");
  for (std::size_t i = 0; i < handlers.size(); ++i) {
    const json::Value &item = handlers[i];
    std::string where = entry_where("file_handlers", i);
    if (!item.is_object())
      throw Error::invalid_config(where, "expected a table");
    warn_unknown_fields(item, {"bundle_id", "uti"}, where);
    config.file_handlers.push_back({require_string(item, "bundle_id", where),
                                    require_string(item, "uti", where)});
  }

  read_dock(doc, config);
  read_settings(doc, config);

  config.validate();
  return config;
}

void Config::merge_with_cli(std::size_t jobs_override, bool verbose_override) {
  if (jobs_override > 0) {
    settings.jobs = jobs_override;
  }
  if (verbose_override) {
    verbose = true;
  }
}

void Config::validate() const {
  std::set<std::pair<std::string, std::string>> seen;
  auto claim = [&](const std::string &kind, const std::string &id) {
    if (!seen.insert({kind, id}).second) {
      throw Error::invalid_config(kind + " " + id,
                                  "declared more than once");
    }
  };

  for (const auto &p : packages)
    claim(p.kind, p.name);
  for (const auto &p : preferences)
    claim(KIND_PREFERENCE, p.id());
  for (const auto &s : symlinks)
    claim(KIND_SYMLINK, s.target.string());
  for (const auto &h : file_handlers)
    claim(KIND_FILE_HANDLER, h.uti);
  for (const auto &a : dock.apps)
    claim(KIND_DOCK_APP, a.string());
  for (const auto &f : dock.folders)
    claim(KIND_DOCK_FOLDER, f.path.string());
  for (const auto &s : services)
    claim(KIND_SERVICE, s.name);
}

bool Config::has_service(const std::string &name) const {
  for (const auto &s : services) {
    if (s.name == name)
      return true;
  }
  return false;
}

std::string Config::service_for_domain(const std::string &domain) const {
  for (const auto &s : services) {
    for (const auto &d : s.domains) {
      if (d == domain)
        return s.name;
    }
  }
  auto it = BUILTIN_DOMAIN_SERVICES.find(domain);
  if (it != BUILTIN_DOMAIN_SERVICES.end() && has_service(it->second)) {
    return it->second;
  }
  return "";
}

} // namespace converge
