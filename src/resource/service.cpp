// resource/service.cpp - Service restart implementation
#include "service.hpp"
#include "../defs.hpp"
#include "../utils.hpp"

namespace converge {

ServiceResource::ServiceResource(std::string name, CommandRunner &runner)
    : name_(std::move(name)), runner_(runner) {}

std::string ServiceResource::kind() const { return KIND_SERVICE; }

Outcome ServiceResource::apply(const ApplyContext &ctx) {
  if (ctx.dry_run)
    return Outcome::skipped("dry-run");

  // launchd brings the process back after it exits
  CommandOutput out = runner_.run(TOOL_KILLALL, {name_});
  if (out.spawn_failed)
    throw Error::tool_missing(TOOL_KILLALL);
  if (!out.success()) {
    LOG_DEBUG(name_ + " not running: " + trim(out.stderr_text));
    return Outcome::skipped("not running");
  }
  return Outcome::modified();
}

} // namespace converge
