// core/planner.hpp - Execution planning and target filtering
#pragma once

#include "diff.hpp"
#include "privilege.hpp"
#include "resource.hpp"
#include <string>
#include <vector>

namespace converge {

struct ExecutionPlan {
  std::vector<ResourcePtr> unprivileged;
  std::vector<ResourcePtr> privileged;
  // Ordered, unique service names to restart after both batches
  std::vector<std::string> post_actions;

  std::size_t size() const { return unprivileged.size() + privileged.size(); }
  bool empty() const { return size() == 0; }
};

// `kind`, `kind.fragment` or a bare id fragment. kind is empty when the
// target does not start with a known kind or alias.
struct Target {
  std::string kind;
  std::string fragment;

  bool matches(const std::string &resource_kind,
               const std::string &resource_id) const;
};

Target parse_target(const std::string &raw);

// packages -> package, defaults -> preference, ...; "" if not a kind
std::string resolve_kind(const std::string &name);

ExecutionPlan build_plan(const std::vector<DiffRecord> &diffs,
                         const PrivilegeClassifier &classifier);

ExecutionPlan filter_plan(const ExecutionPlan &plan, const Target &target);

} // namespace converge
