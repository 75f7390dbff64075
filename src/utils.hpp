// utils.hpp - Utility functions
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace converge {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, bool console, const fs::path &log_path);
  void log(const std::string &level, const std::string &message);
  bool verbose() const { return verbose_; }

private:
  Logger() = default;
  bool verbose_ = false;
  bool console_ = true;
  std::mutex mutex_;
  std::unique_ptr<std::ofstream> log_file_;
};

#define LOG_INFO(msg) Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) Logger::getInstance().log("DEBUG", msg)

// File system utilities
bool ensure_dir_exists(const fs::path &path);
bool is_symlink_path(const fs::path &path);
bool path_exists_no_follow(const fs::path &path);
fs::path canonical_or_self(const fs::path &path);

// String utilities
std::string trim(const std::string &s);
std::string to_lower(std::string s);
bool contains_ci(const std::string &haystack, const std::string &needle);
bool starts_with(const std::string &s, const std::string &prefix);
std::vector<std::string> split_lines(const std::string &text);
std::string join(const std::vector<std::string> &parts,
                 const std::string &sep);

} // namespace converge
