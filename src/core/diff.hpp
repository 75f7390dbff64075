// core/diff.hpp - Current vs desired state comparison
#pragma once

#include "error.hpp"
#include "privilege.hpp"
#include "resource.hpp"
#include <optional>
#include <vector>

namespace converge {

struct DiffRecord {
  ResourcePtr resource;
  std::string resource_id;
  std::string kind;
  std::string description;
  State current_state;
  State desired_state;
  bool privileged = false;
  // Set when current_state() threw; current_state is then Unknown
  std::optional<Error> inspection_error;

  bool inspection_failed() const { return inspection_error.has_value(); }
};

struct DiffSummary {
  std::size_t additions = 0;
  std::size_t removals = 0;
  std::size_t modifications = 0;
  std::size_t privileged = 0;
  std::size_t inspection_failures = 0;

  std::size_t total() const { return additions + removals + modifications; }
};

// Preserves input order. A failed inspection always yields a record.
std::vector<DiffRecord> compute_diffs(const std::vector<ResourcePtr> &resources,
                                      const PrivilegeClassifier &classifier);

DiffSummary summarize(const std::vector<DiffRecord> &diffs);

} // namespace converge
