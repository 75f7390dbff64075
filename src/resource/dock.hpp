// resource/dock.hpp - Dock applications and folders
#pragma once

#include "../conf/config.hpp"
#include "../core/resource.hpp"
#include "../core/runner.hpp"

namespace converge {

// Shared inspection of the Dock's persistent lists
class DockEntryResource : public Resource {
public:
  DockEntryResource(fs::path path, std::string restart_service,
                    CommandRunner &runner);

  std::string id() const override { return path_.string(); }
  State desired_state() const override { return State::present(id()); }
  State current_state() override;
  Outcome apply(const ApplyContext &ctx) override;
  // dockutil edits one plist; concurrent edits lose entries
  bool parallel_safe() const override { return false; }
  std::vector<std::string> post_actions() const override;

protected:
  fs::path path_;
  std::string restart_service_;
  CommandRunner &runner_;

  virtual const char *persistent_list() const = 0;
  virtual std::vector<std::string> add_args() const = 0;
};

class DockAppResource : public DockEntryResource {
public:
  using DockEntryResource::DockEntryResource;

  std::string kind() const override;
  std::string description() const override { return "dock app " + id(); }

protected:
  const char *persistent_list() const override { return "persistent-apps"; }
  std::vector<std::string> add_args() const override;
};

class DockFolderResource : public DockEntryResource {
public:
  DockFolderResource(DockFolderEntry entry, std::string restart_service,
                     CommandRunner &runner);

  std::string kind() const override;
  std::string description() const override { return "dock folder " + id(); }

protected:
  const char *persistent_list() const override {
    return "persistent-others";
  }
  std::vector<std::string> add_args() const override;

private:
  DockFolderEntry entry_;
};

// file:// URL as stored in the Dock plist
std::string dock_file_url(const fs::path &path);

} // namespace converge
