// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <sstream>

namespace converge {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, bool console, const fs::path &log_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  verbose_ = verbose;
  console_ = console;

  if (!log_path.empty()) {
    std::error_code ec;
    if (log_path.has_parent_path()) {
      fs::create_directories(log_path.parent_path(), ec);
    }
    if (!ec) {
      log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::app);
    }
    if (!log_file_ || !log_file_->is_open()) {
      log_file_.reset();
      std::cerr << "warning: cannot open log file " << log_path.string()
                << "\n";
    }
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_) {
    return;
  }

  auto now = std::time(nullptr);
  char time_buf[64];
  std::tm tm_buf{};
  localtime_r(&now, &tm_buf);
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::string log_line =
      std::string("[") + time_buf + "] [" + level + "] " + message + "\n";

  std::lock_guard<std::mutex> lock(mutex_);
  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  if (console_ || level == "ERROR") {
    std::cerr << log_line;
  }
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  try {
    if (!fs::exists(path)) {
      fs::create_directories(path);
    }
    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create directory " + path.string() + ": " + e.what());
    return false;
  }
}

bool is_symlink_path(const fs::path &path) {
  std::error_code ec;
  return fs::is_symlink(fs::symlink_status(path, ec));
}

// Dangling symlinks count as existing
bool path_exists_no_follow(const fs::path &path) {
  std::error_code ec;
  auto st = fs::symlink_status(path, ec);
  if (ec) {
    return false;
  }
  return st.type() != fs::file_type::not_found;
}

fs::path canonical_or_self(const fs::path &path) {
  std::error_code ec;
  fs::path resolved = fs::canonical(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  return resolved;
}

// String utilities
std::string trim(const std::string &s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
  for (char &c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

bool contains_ci(const std::string &haystack, const std::string &needle) {
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::stringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

std::string join(const std::vector<std::string> &parts,
                 const std::string &sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      out += sep;
    out += parts[i];
  }
  return out;
}

} // namespace converge
