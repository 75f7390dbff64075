// resource/dock.cpp - Dock resource implementation
#include "dock.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <cctype>
#include <cstdio>

namespace converge {

std::string dock_file_url(const fs::path &path) {
  std::string url = "file://";
  for (unsigned char c : path.string()) {
    if (std::isalnum(c) || c == '/' || c == '.' || c == '-' || c == '_' ||
        c == '~') {
      url += static_cast<char>(c);
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      url += buf;
    }
  }
  return url;
}

DockEntryResource::DockEntryResource(fs::path path,
                                     std::string restart_service,
                                     CommandRunner &runner)
    : path_(std::move(path)), restart_service_(std::move(restart_service)),
      runner_(runner) {}

State DockEntryResource::current_state() {
  CommandOutput out =
      runner_.run(TOOL_DEFAULTS, {"read", "com.apple.dock", persistent_list()});
  if (out.spawn_failed)
    throw Error::unsupported(TOOL_DEFAULTS);
  if (!out.success()) {
    // A fresh account has no persistent list yet
    if (contains_ci(out.stderr_text, "does not exist"))
      return State::absent();
    throw Error::inspection_failed(
        kind(), stderr_tail(out.stderr_text, STDERR_TAIL_LINES));
  }

  std::string plain = path_.string();
  std::string url = dock_file_url(path_);
  if (!plain.empty() && plain.back() != '/')
    plain += '/';
  if (url.back() != '/')
    url += '/';

  const std::string &text = out.stdout_text;
  if (text.find(url) != std::string::npos ||
      text.find(plain) != std::string::npos)
    return State::present(id());
  return State::absent();
}

Outcome DockEntryResource::apply(const ApplyContext &ctx) {
  if (ctx.dry_run)
    return Outcome::skipped("dry-run");
  if (current_state() == desired_state())
    return Outcome::no_change();

  std::error_code ec;
  if (!fs::exists(path_, ec))
    throw Error::not_found(path_.string());

  std::vector<std::string> args = add_args();
  CommandOutput out = runner_.run(TOOL_DOCKUTIL, args);
  if (out.spawn_failed)
    throw Error::tool_missing(TOOL_DOCKUTIL);
  if (!out.success()) {
    throw Error::command_failed(
        format_command(TOOL_DOCKUTIL, args),
        stderr_tail(out.stderr_text, STDERR_TAIL_LINES));
  }
  return Outcome::created();
}

std::vector<std::string> DockEntryResource::post_actions() const {
  if (restart_service_.empty())
    return {};
  return {restart_service_};
}

std::string DockAppResource::kind() const { return KIND_DOCK_APP; }

std::vector<std::string> DockAppResource::add_args() const {
  return {"--add", path_.string(), "--no-restart"};
}

DockFolderResource::DockFolderResource(DockFolderEntry entry,
                                       std::string restart_service,
                                       CommandRunner &runner)
    : DockEntryResource(entry.path, std::move(restart_service), runner),
      entry_(std::move(entry)) {}

std::string DockFolderResource::kind() const { return KIND_DOCK_FOLDER; }

std::vector<std::string> DockFolderResource::add_args() const {
  return {"--add",     path_.string(), "--view",   entry_.view, "--display",
          entry_.display, "--sort",    entry_.sort, "--no-restart"};
}

} // namespace converge
