// resource/symlink.hpp - Symlinks materialized from the config
#pragma once

#include "../conf/config.hpp"
#include "../core/resource.hpp"

namespace converge {

class SymlinkResource : public Resource {
public:
  explicit SymlinkResource(SymlinkEntry entry);

  std::string id() const override { return entry_.target.string(); }
  std::string kind() const override;
  std::string description() const override;
  State desired_state() const override;
  State current_state() override;
  Outcome apply(const ApplyContext &ctx) override;

private:
  SymlinkEntry entry_;

  void link();
};

} // namespace converge
