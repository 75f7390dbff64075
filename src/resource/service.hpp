// resource/service.hpp - Post-convergence process restarts
#pragma once

#include "../core/resource.hpp"
#include "../core/runner.hpp"

namespace converge {

// Always differs from its desired state: a restart is requested, not
// reconciled. Runs in the post-action phase only.
class ServiceResource : public Resource {
public:
  ServiceResource(std::string name, CommandRunner &runner);

  std::string id() const override { return name_; }
  std::string kind() const override;
  std::string description() const override { return "restart " + name_; }
  State desired_state() const override { return State::present("restarted"); }
  State current_state() override { return State::present("running"); }
  Outcome apply(const ApplyContext &ctx) override;
  bool parallel_safe() const override { return false; }

private:
  std::string name_;
  CommandRunner &runner_;
};

} // namespace converge
