// resource/preference.cpp - Preference resource implementation
#include "preference.hpp"
#include "../core/privilege.hpp"
#include "../defs.hpp"
#include "../utils.hpp"

namespace converge {

PreferenceResource::PreferenceResource(PreferenceEntry entry,
                                       std::string restart_service,
                                       CommandRunner &runner)
    : entry_(std::move(entry)), restart_service_(std::move(restart_service)),
      runner_(runner) {}

std::string PreferenceResource::kind() const { return KIND_PREFERENCE; }

std::string PreferenceResource::description() const {
  return entry_.domain + " " + entry_.key + " = " + entry_.value.canonical() +
         " (" + preference_type_name(entry_.value.type) + ")";
}

State PreferenceResource::desired_state() const {
  return State::present(entry_.value.canonical());
}

State PreferenceResource::current_state() {
  CommandOutput out =
      runner_.run(TOOL_DEFAULTS, {"read", entry_.domain, entry_.key});
  if (out.spawn_failed)
    throw Error::unsupported(TOOL_DEFAULTS);
  if (!out.success()) {
    if (contains_ci(out.stderr_text, "does not exist"))
      return State::absent();
    throw Error::inspection_failed(
        KIND_PREFERENCE, stderr_tail(out.stderr_text, STDERR_TAIL_LINES));
  }

  PreferenceValue actual;
  if (!PreferenceValue::parse(entry_.value.type, out.stdout_text, actual)) {
    LOG_DEBUG(id() + ": unparseable value '" + trim(out.stdout_text) + "'");
    return State::absent();
  }

  std::string wanted = entry_.value.canonical();
  std::string found = actual.canonical();
  if (found == wanted)
    return State::present(wanted);
  return State::modified(found, wanted);
}

Outcome PreferenceResource::apply(const ApplyContext &ctx) {
  if (ctx.dry_run)
    return Outcome::skipped("dry-run");

  State current = current_state();
  if (current == desired_state())
    return Outcome::no_change();

  std::vector<std::string> args = {"write", entry_.domain, entry_.key,
                                   entry_.value.write_flag(),
                                   entry_.value.canonical()};

  CommandOutput out;
  if (entry_.privileged) {
    if (!ctx.privileged_runner)
      throw Error::not_validated();
    out = ctx.privileged_runner->run(TOOL_DEFAULTS, args);
  } else {
    out = runner_.run(TOOL_DEFAULTS, args);
  }

  if (out.spawn_failed)
    throw Error::tool_missing(TOOL_DEFAULTS);
  if (!out.success()) {
    if (contains_ci(out.stderr_text, "permission") ||
        contains_ci(out.stderr_text, "not permitted"))
      throw Error::permission(entry_.domain);
    throw Error::command_failed(format_command(TOOL_DEFAULTS, args),
                                stderr_tail(out.stderr_text,
                                            STDERR_TAIL_LINES));
  }

  return current.is_absent() ? Outcome::created() : Outcome::modified();
}

std::vector<std::string> PreferenceResource::post_actions() const {
  if (restart_service_.empty())
    return {};
  return {restart_service_};
}

} // namespace converge
