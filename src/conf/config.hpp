// conf/config.hpp - Configuration management
#pragma once

#include "../core/json.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace converge {

enum class PreferenceType { Bool, Int, Float, String };

const char *preference_type_name(PreferenceType type);

struct PreferenceValue {
  PreferenceType type = PreferenceType::String;
  bool bool_value = false;
  std::int64_t int_value = 0;
  double float_value = 0.0;
  std::string string_value;

  static PreferenceValue of_bool(bool v);
  static PreferenceValue of_int(std::int64_t v);
  static PreferenceValue of_float(double v);
  static PreferenceValue of_string(const std::string &v);

  // Parses the output of a preference read. Returns false when the raw
  // text is not a valid value of the given type.
  static bool parse(PreferenceType type, const std::string &raw,
                    PreferenceValue &out);

  std::string canonical() const;
  const char *write_flag() const;
};

struct PackageEntry {
  std::string kind;
  std::string name;
  std::string version;
  bool privileged = false;
};

struct PreferenceEntry {
  std::string domain;
  std::string key;
  PreferenceValue value;
  bool privileged = false;

  std::string id() const { return domain + "." + key; }
};

struct SymlinkEntry {
  fs::path source;
  fs::path target;
  bool force = false;
};

struct ServiceEntry {
  std::string name;
  std::vector<std::string> domains;
};

struct FileHandlerEntry {
  std::string bundle_id;
  std::string uti;
};

struct DockFolderEntry {
  fs::path path;
  std::string view = "grid";
  std::string display = "stack";
  std::string sort = "dateadded";
};

struct DockConfig {
  std::vector<fs::path> apps;
  std::vector<DockFolderEntry> folders;
};

struct PrivilegeAllowlist {
  std::set<std::string> packages;
  std::set<std::string> preferences;
};

struct Settings {
  std::size_t jobs;
  std::uint32_t retry_attempts;
  std::uint32_t retry_delay_ms;
  fs::path log_file;

  Settings();
};

struct Config {
  fs::path source_path;
  bool verbose = false;
  std::map<std::string, std::string> locations;
  std::vector<PackageEntry> packages;
  std::vector<PreferenceEntry> preferences;
  std::vector<SymlinkEntry> symlinks;
  std::vector<ServiceEntry> services;
  std::vector<FileHandlerEntry> file_handlers;
  DockConfig dock;
  PrivilegeAllowlist allowlist;
  Settings settings;

  static Config load_default();
  static Config from_file(const fs::path &path);
  static Config from_toml(const std::string &text,
                          const std::string &origin = "<config>");
  static Config from_document(const json::Value &doc,
                              const std::string &origin);

  void merge_with_cli(std::size_t jobs_override, bool verbose_override);

  // Throws InvalidConfig on duplicate (kind, id) pairs
  void validate() const;

  bool has_service(const std::string &name) const;
  // Declared service that owns a preference domain, or "" if none
  std::string service_for_domain(const std::string &domain) const;
};

bool is_package_kind(const std::string &kind);

} // namespace converge
