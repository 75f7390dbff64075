// resource/package.cpp - Package resource implementation
#include "package.hpp"
#include "../core/json.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <sstream>

namespace converge {

PackageResource::PackageResource(PackageEntry entry, CommandRunner &runner,
                                 RetryPolicy retry)
    : entry_(std::move(entry)), runner_(runner), retry_(retry) {}

std::string PackageResource::description() const {
  std::string desc = entry_.kind + " " + entry_.name;
  if (!entry_.version.empty())
    desc += " (" + entry_.version + ")";
  return desc;
}

// brew info --json=v2: formulae[0].installed is a non-empty array when
// installed; casks[0].installed is a version string or null.
bool PackageResource::brew_info_installed(const std::string &json_text) const {
  json::Value doc;
  try {
    doc = json::parse(json_text);
  } catch (const std::exception &e) {
    throw Error::inspection_failed(entry_.kind, e.what());
  }

  bool cask = entry_.kind == KIND_CASK;
  const json::Value *list = doc.find(cask ? "casks" : "formulae");
  if (!list || !list->is_array() || list->size() == 0)
    return false;

  const json::Value *installed = (*list)[0].find("installed");
  if (!installed)
    return false;
  if (cask)
    return installed->is_string() && !installed->as_string().empty();
  return installed->is_array() && installed->size() > 0;
}

bool PackageResource::listed(const std::string &cmd,
                             const std::vector<std::string> &args,
                             bool first_column_only) {
  CommandOutput out = runner_.run(cmd, args);
  if (out.spawn_failed)
    throw Error::unsupported(cmd);
  if (!out.success()) {
    throw Error::inspection_failed(
        entry_.kind, stderr_tail(out.stderr_text, STDERR_TAIL_LINES));
  }

  const std::string wanted = to_lower(entry_.name);
  for (const auto &line : split_lines(out.stdout_text)) {
    std::istringstream tokens(line);
    std::string token;
    while (tokens >> token) {
      if (to_lower(token) == wanted)
        return true;
      if (first_column_only)
        break;
    }
  }
  return false;
}

State PackageResource::current_state() {
  bool installed = false;

  if (entry_.kind == KIND_FORMULA || entry_.kind == KIND_CASK) {
    std::string flag = entry_.kind == KIND_CASK ? "--cask" : "--formula";
    CommandOutput out =
        runner_.run(TOOL_BREW, {"info", "--json=v2", flag, entry_.name});
    if (out.spawn_failed)
      throw Error::unsupported(TOOL_BREW);
    if (!out.success()) {
      Error err = classify_install_error(out.stderr_text, entry_.name);
      // Unknown to brew means not installed; the install reports NotFound
      if (err.kind() == ErrorKind::NotFound)
        return State::absent();
      throw Error::inspection_failed(
          entry_.kind, stderr_tail(out.stderr_text, STDERR_TAIL_LINES));
    }
    installed = brew_info_installed(out.stdout_text);
  } else if (entry_.kind == KIND_TAP) {
    installed = listed(TOOL_BREW, {"tap"}, true);
  } else if (entry_.kind == KIND_STORE_APP) {
    // mas list: "<id>  <name>  (<version>)"
    installed = listed(TOOL_MAS, {"list"}, true);
  } else if (entry_.kind == KIND_NODE_GLOBAL) {
    installed = listed(TOOL_PNPM, {"list", "-g", "--depth=0"}, false);
  } else {
    throw Error::unsupported(entry_.kind);
  }

  return installed ? State::present() : State::absent();
}

void PackageResource::install_once() {
  std::string cmd;
  std::vector<std::string> args;

  if (entry_.kind == KIND_FORMULA) {
    cmd = TOOL_BREW;
    args = {"install", "--formula", entry_.name};
  } else if (entry_.kind == KIND_CASK) {
    cmd = TOOL_BREW;
    args = {"install", "--cask", entry_.name};
  } else if (entry_.kind == KIND_TAP) {
    cmd = TOOL_BREW;
    args = {"tap", entry_.name};
  } else if (entry_.kind == KIND_STORE_APP) {
    cmd = TOOL_MAS;
    args = {"install", entry_.name};
  } else if (entry_.kind == KIND_NODE_GLOBAL) {
    cmd = TOOL_PNPM;
    args = {"add", "-g", entry_.name};
  } else {
    throw Error::unsupported(entry_.kind);
  }

  // Privileged casks prompt through sudo themselves; the cached credential
  // of the privilege context covers them.
  CommandOutput out = runner_.run(cmd, args);
  if (out.spawn_failed)
    throw Error::tool_missing(cmd);
  if (!out.success())
    throw classify_install_error(out.stderr_text, entry_.name);
}

Outcome PackageResource::apply(const ApplyContext &ctx) {
  if (ctx.dry_run)
    return Outcome::skipped("dry-run");

  if (current_state() == desired_state())
    return Outcome::no_change();

  try {
    with_retry(retry_, entry_.kind + " " + entry_.name,
               [this]() { install_once(); });
  } catch (const Error &e) {
    if (e.ignorable())
      return Outcome::no_change();
    throw;
  }
  return Outcome::created();
}

} // namespace converge
