// core/error.hpp - Typed errors for inspection, apply and configuration
#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace converge {

enum class ErrorKind {
  Network,
  NotFound,
  Conflict,
  Permission,
  AlreadyInstalled,
  ToolMissing,
  InspectionFailed,
  InvalidConfig,
  PrivilegeDenied,
  NotValidated,
  CommandFailed,
  Unsupported,
};

const char *error_kind_name(ErrorKind kind);

// An error carries its kind plus named context fields. what() is derived from
// them; callers that need a field read it with field().
class Error : public std::runtime_error {
public:
  using Fields = std::vector<std::pair<std::string, std::string>>;

  Error(ErrorKind kind, Fields fields);

  ErrorKind kind() const { return kind_; }
  const Fields &fields() const { return fields_; }
  std::string field(const std::string &name) const;

  // Only network failures are worth another attempt
  bool retryable() const { return kind_ == ErrorKind::Network; }
  // The operation already happened
  bool ignorable() const { return kind_ == ErrorKind::AlreadyInstalled; }

  static Error network(const std::string &message);
  static Error not_found(const std::string &name);
  static Error conflict(const std::string &message);
  static Error permission(const std::string &path);
  static Error already_installed(const std::string &name);
  static Error tool_missing(const std::string &tool);
  static Error inspection_failed(const std::string &kind,
                                 const std::string &cause);
  static Error invalid_config(const std::string &where, const std::string &why);
  static Error privilege_denied(const std::string &reason);
  static Error not_validated();
  static Error command_failed(const std::string &cmd,
                              const std::string &stderr_tail);
  static Error unsupported(const std::string &feature);

private:
  ErrorKind kind_;
  Fields fields_;
};

// Maps the stderr of a failed install verb to a typed error
Error classify_install_error(const std::string &stderr_text,
                             const std::string &name);

// Last `lines` non-empty lines of a command's stderr
std::string stderr_tail(const std::string &text, std::size_t lines);

} // namespace converge
