// core/resource.hpp - Uniform contract for inspectable, convergeable state
#pragma once

#include "state.hpp"
#include <memory>
#include <string>
#include <vector>

namespace converge {

class PrivilegeContext;

struct PrivilegeHint {
  bool required = false;
  std::string reason;

  static PrivilegeHint none() { return PrivilegeHint(); }
  static PrivilegeHint requires_privilege(const std::string &reason) {
    return PrivilegeHint{true, reason};
  }
};

struct ApplyContext {
  bool dry_run = false;
  bool verbose = false;
  // Set only while the privileged batch runs
  PrivilegeContext *privileged_runner = nullptr;
};

// current_state() and apply() throw converge::Error. apply() must re-read
// the live state and must not mutate anything when ctx.dry_run is set.
class Resource {
public:
  virtual ~Resource() = default;

  virtual std::string id() const = 0;
  virtual std::string kind() const = 0;
  virtual std::string description() const = 0;
  virtual State desired_state() const = 0;
  virtual State current_state() = 0;
  virtual Outcome apply(const ApplyContext &ctx) = 0;

  virtual PrivilegeHint privilege_hint() const { return PrivilegeHint::none(); }
  virtual bool parallel_safe() const { return true; }
  // Services to restart once this resource has been converged
  virtual std::vector<std::string> post_actions() const { return {}; }

  bool needs_apply() { return current_state() != desired_state(); }
};

using ResourcePtr = std::shared_ptr<Resource>;

} // namespace converge
