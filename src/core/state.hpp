// core/state.hpp - Resource state, apply outcomes and run summary
#pragma once

#include "error.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace converge {

enum class StateKind { Absent, Present, Modified, Unknown };

// Observed or declared state of a resource. Present carries an optional
// fingerprint; Modified is only produced by a resource's own inspection.
struct State {
  StateKind kind = StateKind::Unknown;
  std::optional<std::string> details;
  std::string from;
  std::string to;

  static State absent();
  static State present();
  static State present(const std::string &details);
  static State modified(const std::string &from, const std::string &to);
  static State unknown();

  bool is_absent() const { return kind == StateKind::Absent; }
  bool is_present() const { return kind == StateKind::Present; }

  std::string to_string() const;
};

bool operator==(const State &a, const State &b);
bool operator!=(const State &a, const State &b);

enum class OutcomeKind { NoChange, Created, Modified, Removed, Failed, Skipped };

struct Outcome {
  OutcomeKind kind = OutcomeKind::NoChange;
  std::string reason;         // Skipped
  std::optional<Error> error; // Failed

  static Outcome no_change();
  static Outcome created();
  static Outcome modified();
  static Outcome removed();
  static Outcome failed(const Error &error);
  static Outcome skipped(const std::string &reason);

  bool changed() const;
  std::string to_string() const;
};

const char *outcome_kind_name(OutcomeKind kind);

struct FailureRecord {
  std::string resource_id;
  std::string kind;
  Error error;
};

struct Summary {
  std::size_t created = 0;
  std::size_t modified = 0;
  std::size_t removed = 0;
  std::size_t skipped = 0;
  std::size_t failed = 0;
  std::size_t no_change = 0;
  bool privilege_denied = false;
  std::vector<FailureRecord> failures;

  void record(const std::string &resource_id, const std::string &kind,
              const Outcome &outcome);
  std::size_t total() const;
  bool success() const { return failed == 0; }
};

} // namespace converge
