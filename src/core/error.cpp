// core/error.cpp - Typed errors implementation
#include "error.hpp"
#include "../defs.hpp"
#include "../utils.hpp"

namespace converge {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Network:
    return "network";
  case ErrorKind::NotFound:
    return "not-found";
  case ErrorKind::Conflict:
    return "conflict";
  case ErrorKind::Permission:
    return "permission";
  case ErrorKind::AlreadyInstalled:
    return "already-installed";
  case ErrorKind::ToolMissing:
    return "tool-missing";
  case ErrorKind::InspectionFailed:
    return "inspection-failed";
  case ErrorKind::InvalidConfig:
    return "invalid-config";
  case ErrorKind::PrivilegeDenied:
    return "privilege-denied";
  case ErrorKind::NotValidated:
    return "not-validated";
  case ErrorKind::CommandFailed:
    return "command-failed";
  case ErrorKind::Unsupported:
    return "unsupported";
  }
  return "unknown";
}

static std::string describe(ErrorKind kind, const Error::Fields &fields) {
  std::string msg = error_kind_name(kind);
  for (const auto &[key, value] : fields) {
    if (key == "stderr_tail" || value.empty())
      continue;
    msg += " " + key + "=" + value;
  }
  return msg;
}

Error::Error(ErrorKind kind, Fields fields)
    : std::runtime_error(describe(kind, fields)), kind_(kind),
      fields_(std::move(fields)) {}

std::string Error::field(const std::string &name) const {
  for (const auto &[key, value] : fields_) {
    if (key == name)
      return value;
  }
  return "";
}

Error Error::network(const std::string &message) {
  return Error(ErrorKind::Network, {{"message", message}});
}

Error Error::not_found(const std::string &name) {
  return Error(ErrorKind::NotFound, {{"name", name}});
}

Error Error::conflict(const std::string &message) {
  return Error(ErrorKind::Conflict, {{"message", message}});
}

Error Error::permission(const std::string &path) {
  return Error(ErrorKind::Permission, {{"path", path}});
}

Error Error::already_installed(const std::string &name) {
  return Error(ErrorKind::AlreadyInstalled, {{"name", name}});
}

Error Error::tool_missing(const std::string &tool) {
  return Error(ErrorKind::ToolMissing, {{"tool", tool}});
}

Error Error::inspection_failed(const std::string &kind,
                               const std::string &cause) {
  return Error(ErrorKind::InspectionFailed, {{"kind", kind}, {"cause", cause}});
}

Error Error::invalid_config(const std::string &where, const std::string &why) {
  return Error(ErrorKind::InvalidConfig, {{"where", where}, {"why", why}});
}

Error Error::privilege_denied(const std::string &reason) {
  return Error(ErrorKind::PrivilegeDenied, {{"reason", reason}});
}

Error Error::not_validated() { return Error(ErrorKind::NotValidated, {}); }

Error Error::command_failed(const std::string &cmd,
                            const std::string &stderr_tail) {
  return Error(ErrorKind::CommandFailed,
               {{"cmd", cmd}, {"stderr_tail", stderr_tail}});
}

Error Error::unsupported(const std::string &feature) {
  return Error(ErrorKind::Unsupported, {{"feature", feature}});
}

namespace {

struct ErrorPattern {
  const char *needle;
  ErrorKind kind;
};

// Order matters: the first match wins.
const ErrorPattern INSTALL_ERROR_PATTERNS[] = {
    {"curl", ErrorKind::Network},
    {"could not resolve", ErrorKind::Network},
    {"connection refused", ErrorKind::Network},
    {"timed out", ErrorKind::Network},
    {"network", ErrorKind::Network},
    {"ssl", ErrorKind::Network},
    {"certificate", ErrorKind::Network},
    {"failed to download", ErrorKind::Network},
    {"sha256 mismatch", ErrorKind::Network},
    {"no available formula", ErrorKind::NotFound},
    {"no formulae found", ErrorKind::NotFound},
    {"no cask with this name", ErrorKind::NotFound},
    {"couldn't find", ErrorKind::NotFound},
    {"no such keg", ErrorKind::NotFound},
    {"unknown", ErrorKind::NotFound},
    {"already installed", ErrorKind::AlreadyInstalled},
    {"is already an installed", ErrorKind::AlreadyInstalled},
    {"permission denied", ErrorKind::Permission},
    {"operation not permitted", ErrorKind::Permission},
    {"cannot write", ErrorKind::Permission},
    {"conflicts with", ErrorKind::Conflict},
    {"conflict", ErrorKind::Conflict},
    {"depends on", ErrorKind::Conflict},
    {"dependency", ErrorKind::Conflict},
};

} // namespace

Error classify_install_error(const std::string &stderr_text,
                             const std::string &name) {
  const std::string lowered = to_lower(stderr_text);
  const std::string tail = stderr_tail(stderr_text, STDERR_TAIL_LINES);

  for (const auto &pattern : INSTALL_ERROR_PATTERNS) {
    if (lowered.find(pattern.needle) == std::string::npos)
      continue;

    switch (pattern.kind) {
    case ErrorKind::Network:
      return Error::network(tail);
    case ErrorKind::NotFound:
      return Error::not_found(name);
    case ErrorKind::AlreadyInstalled:
      return Error::already_installed(name);
    case ErrorKind::Permission:
      return Error(ErrorKind::Permission, {{"path", name}, {"stderr_tail", tail}});
    case ErrorKind::Conflict:
      return Error::conflict(tail);
    default:
      break;
    }
  }

  return Error::command_failed("install " + name, tail);
}

std::string stderr_tail(const std::string &text, std::size_t lines) {
  std::vector<std::string> kept;
  for (const auto &line : split_lines(text)) {
    if (!trim(line).empty())
      kept.push_back(line);
  }
  if (kept.size() > lines) {
    kept.erase(kept.begin(), kept.end() - static_cast<long>(lines));
  }
  return join(kept, "\n");
}

} // namespace converge
