// resource/preference.hpp - macOS defaults entries
#pragma once

#include "../conf/config.hpp"
#include "../core/resource.hpp"
#include "../core/runner.hpp"

namespace converge {

class PreferenceResource : public Resource {
public:
  // restart_service may be empty
  PreferenceResource(PreferenceEntry entry, std::string restart_service,
                     CommandRunner &runner);

  std::string id() const override { return entry_.id(); }
  std::string kind() const override;
  std::string description() const override;
  State desired_state() const override;
  State current_state() override;
  Outcome apply(const ApplyContext &ctx) override;
  std::vector<std::string> post_actions() const override;

private:
  PreferenceEntry entry_;
  std::string restart_service_;
  CommandRunner &runner_;
};

} // namespace converge
