// core/state.cpp - Resource state implementation
#include "state.hpp"

namespace converge {

State State::absent() {
  State s;
  s.kind = StateKind::Absent;
  return s;
}

State State::present() {
  State s;
  s.kind = StateKind::Present;
  return s;
}

State State::present(const std::string &details) {
  State s;
  s.kind = StateKind::Present;
  s.details = details;
  return s;
}

State State::modified(const std::string &from, const std::string &to) {
  State s;
  s.kind = StateKind::Modified;
  s.from = from;
  s.to = to;
  return s;
}

State State::unknown() { return State(); }

std::string State::to_string() const {
  switch (kind) {
  case StateKind::Absent:
    return "absent";
  case StateKind::Present:
    return details ? "present(" + *details + ")" : "present";
  case StateKind::Modified:
    return from + " -> " + to;
  case StateKind::Unknown:
    return "unknown";
  }
  return "unknown";
}

bool operator==(const State &a, const State &b) {
  if (a.kind != b.kind)
    return false;
  switch (a.kind) {
  case StateKind::Present:
    return a.details == b.details;
  case StateKind::Modified:
    return a.from == b.from && a.to == b.to;
  default:
    return true;
  }
}

bool operator!=(const State &a, const State &b) { return !(a == b); }

Outcome Outcome::no_change() { return Outcome(); }

Outcome Outcome::created() {
  Outcome o;
  o.kind = OutcomeKind::Created;
  return o;
}

Outcome Outcome::modified() {
  Outcome o;
  o.kind = OutcomeKind::Modified;
  return o;
}

Outcome Outcome::removed() {
  Outcome o;
  o.kind = OutcomeKind::Removed;
  return o;
}

Outcome Outcome::failed(const Error &error) {
  Outcome o;
  o.kind = OutcomeKind::Failed;
  o.error = error;
  return o;
}

Outcome Outcome::skipped(const std::string &reason) {
  Outcome o;
  o.kind = OutcomeKind::Skipped;
  o.reason = reason;
  return o;
}

bool Outcome::changed() const {
  return kind == OutcomeKind::Created || kind == OutcomeKind::Modified ||
         kind == OutcomeKind::Removed;
}

const char *outcome_kind_name(OutcomeKind kind) {
  switch (kind) {
  case OutcomeKind::NoChange:
    return "no change";
  case OutcomeKind::Created:
    return "created";
  case OutcomeKind::Modified:
    return "modified";
  case OutcomeKind::Removed:
    return "removed";
  case OutcomeKind::Failed:
    return "failed";
  case OutcomeKind::Skipped:
    return "skipped";
  }
  return "unknown";
}

std::string Outcome::to_string() const {
  std::string out = outcome_kind_name(kind);
  if (kind == OutcomeKind::Skipped && !reason.empty())
    out += ": " + reason;
  if (kind == OutcomeKind::Failed && error)
    out += ": " + std::string(error->what());
  return out;
}

void Summary::record(const std::string &resource_id, const std::string &kind,
                     const Outcome &outcome) {
  switch (outcome.kind) {
  case OutcomeKind::NoChange:
    no_change++;
    break;
  case OutcomeKind::Created:
    created++;
    break;
  case OutcomeKind::Modified:
    modified++;
    break;
  case OutcomeKind::Removed:
    removed++;
    break;
  case OutcomeKind::Skipped:
    skipped++;
    break;
  case OutcomeKind::Failed:
    failed++;
    if (outcome.error) {
      failures.push_back({resource_id, kind, *outcome.error});
    } else {
      failures.push_back(
          {resource_id, kind, Error::command_failed(resource_id, "")});
    }
    break;
  }
}

std::size_t Summary::total() const {
  return created + modified + removed + skipped + failed + no_change;
}

} // namespace converge
