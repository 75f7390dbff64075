// resource/extension.cpp - Extension resource implementation
#include "extension.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <sstream>

namespace converge {

ExtensionResource::ExtensionResource(std::string kind, std::string name,
                                     CommandRunner &runner, RetryPolicy retry)
    : kind_(std::move(kind)), name_(std::move(name)), runner_(runner),
      retry_(retry) {}

std::string ExtensionResource::tool() const {
  return kind_ == KIND_EDITOR_EXTENSION ? TOOL_CODE : TOOL_GH;
}

State ExtensionResource::current_state() {
  bool editor = kind_ == KIND_EDITOR_EXTENSION;
  CommandOutput out =
      editor ? runner_.run(TOOL_CODE, {"--list-extensions"})
             : runner_.run(TOOL_GH, {"extension", "list"});
  if (out.spawn_failed)
    throw Error::unsupported(tool());
  if (!out.success()) {
    throw Error::inspection_failed(
        kind_, stderr_tail(out.stderr_text, STDERR_TAIL_LINES));
  }

  const std::string wanted = to_lower(name_);
  for (const auto &line : split_lines(out.stdout_text)) {
    if (editor) {
      // One publisher.name per line
      if (to_lower(trim(line)) == wanted)
        return State::present();
      continue;
    }
    // gh: "gh dash\tdlvhdr/gh-dash\tv4.0.0"
    std::istringstream tokens(line);
    std::string token;
    while (tokens >> token) {
      if (to_lower(token) == wanted)
        return State::present();
    }
  }
  return State::absent();
}

Outcome ExtensionResource::apply(const ApplyContext &ctx) {
  if (ctx.dry_run)
    return Outcome::skipped("dry-run");
  if (current_state() == desired_state())
    return Outcome::no_change();

  std::vector<std::string> args;
  if (kind_ == KIND_EDITOR_EXTENSION) {
    args = {"--install-extension", name_, "--force"};
  } else {
    args = {"extension", "install", name_};
  }

  try {
    with_retry(retry_, kind_ + " " + name_, [&]() {
      CommandOutput out = runner_.run(tool(), args);
      if (out.spawn_failed)
        throw Error::tool_missing(tool());
      if (!out.success())
        throw classify_install_error(out.stderr_text, name_);
    });
  } catch (const Error &e) {
    if (e.ignorable())
      return Outcome::no_change();
    throw;
  }
  return Outcome::created();
}

} // namespace converge
