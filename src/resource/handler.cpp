// resource/handler.cpp - File handler resource implementation
#include "handler.hpp"
#include "../defs.hpp"
#include "../utils.hpp"

namespace converge {

FileHandlerResource::FileHandlerResource(FileHandlerEntry entry,
                                         CommandRunner &runner)
    : entry_(std::move(entry)), runner_(runner) {}

std::string FileHandlerResource::kind() const { return KIND_FILE_HANDLER; }

std::string FileHandlerResource::description() const {
  return entry_.uti + " opens with " + entry_.bundle_id;
}

State FileHandlerResource::desired_state() const {
  return State::present(entry_.bundle_id);
}

// duti -x prints the handler's name, path and bundle id, one per line
State FileHandlerResource::current_state() {
  CommandOutput out = runner_.run(TOOL_DUTI, {"-x", entry_.uti});
  if (out.spawn_failed)
    throw Error::unsupported(TOOL_DUTI);
  if (!out.success())
    return State::absent();

  std::vector<std::string> lines = split_lines(out.stdout_text);
  for (const auto &line : lines) {
    if (to_lower(trim(line)) == to_lower(entry_.bundle_id))
      return State::present(entry_.bundle_id);
  }
  if (lines.size() >= 3)
    return State::modified(trim(lines[2]), entry_.bundle_id);
  return State::absent();
}

Outcome FileHandlerResource::apply(const ApplyContext &ctx) {
  if (ctx.dry_run)
    return Outcome::skipped("dry-run");

  State current = current_state();
  if (current == desired_state())
    return Outcome::no_change();

  std::vector<std::string> args = {"-s", entry_.bundle_id, entry_.uti, "all"};
  CommandOutput out = runner_.run(TOOL_DUTI, args);
  if (out.spawn_failed)
    throw Error::tool_missing(TOOL_DUTI);
  if (!out.success()) {
    throw Error::command_failed(
        format_command(TOOL_DUTI, args),
        stderr_tail(out.stderr_text, STDERR_TAIL_LINES));
  }
  return current.is_absent() ? Outcome::created() : Outcome::modified();
}

} // namespace converge
