// resource/extension.hpp - Editor and gh CLI extensions
#pragma once

#include "../core/resource.hpp"
#include "../core/retry.hpp"
#include "../core/runner.hpp"

namespace converge {

// editor-extension uses `code`, cli-extension uses `gh extension`
class ExtensionResource : public Resource {
public:
  ExtensionResource(std::string kind, std::string name, CommandRunner &runner,
                    RetryPolicy retry);

  std::string id() const override { return name_; }
  std::string kind() const override { return kind_; }
  std::string description() const override { return kind_ + " " + name_; }
  State desired_state() const override { return State::present(); }
  State current_state() override;
  Outcome apply(const ApplyContext &ctx) override;

private:
  std::string kind_;
  std::string name_;
  CommandRunner &runner_;
  RetryPolicy retry_;

  std::string tool() const;
};

} // namespace converge
