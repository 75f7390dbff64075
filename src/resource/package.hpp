// resource/package.hpp - Packages managed by brew, mas and pnpm
#pragma once

#include "../conf/config.hpp"
#include "../core/resource.hpp"
#include "../core/retry.hpp"
#include "../core/runner.hpp"

namespace converge {

// Covers formula, cask, tap, store-app and node-global kinds
class PackageResource : public Resource {
public:
  PackageResource(PackageEntry entry, CommandRunner &runner,
                  RetryPolicy retry);

  std::string id() const override { return entry_.name; }
  std::string kind() const override { return entry_.kind; }
  std::string description() const override;
  State desired_state() const override { return State::present(); }
  State current_state() override;
  Outcome apply(const ApplyContext &ctx) override;

private:
  PackageEntry entry_;
  CommandRunner &runner_;
  RetryPolicy retry_;

  bool brew_info_installed(const std::string &json_text) const;
  bool listed(const std::string &cmd, const std::vector<std::string> &args,
              bool first_column_only);
  void install_once();
};

} // namespace converge
