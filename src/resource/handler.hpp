// resource/handler.hpp - Default application for a uniform type identifier
#pragma once

#include "../conf/config.hpp"
#include "../core/resource.hpp"
#include "../core/runner.hpp"

namespace converge {

class FileHandlerResource : public Resource {
public:
  FileHandlerResource(FileHandlerEntry entry, CommandRunner &runner);

  std::string id() const override { return entry_.uti; }
  std::string kind() const override;
  std::string description() const override;
  State desired_state() const override;
  State current_state() override;
  Outcome apply(const ApplyContext &ctx) override;
  // duti rewrites the LaunchServices database
  bool parallel_safe() const override { return false; }

private:
  FileHandlerEntry entry_;
  CommandRunner &runner_;
};

} // namespace converge
