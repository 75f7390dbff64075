// core/privilege.cpp - sudo credential handling
#include "privilege.hpp"
#include "../conf/config.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <iostream>

namespace converge {

PrivilegeContext::PrivilegeContext(CommandRunner &runner,
                                   const std::string &reason)
    : runner_(runner) {
  std::cout << "\nAdministrator access is required: " << reason << "\n";
  LOG_INFO("Acquiring privilege: " + reason);

  int code = runner_.run_interactive(TOOL_SUDO, {"-v"});
  if (code != 0) {
    LOG_ERROR("Privilege validation failed (sudo exit " +
              std::to_string(code) + ")");
    throw Error::privilege_denied("credential validation failed");
  }
  LOG_DEBUG("Privilege acquired");
}

PrivilegeContext::~PrivilegeContext() {
  try {
    CommandOutput out = runner_.run(TOOL_SUDO, {"-k"});
    if (!out.success()) {
      LOG_WARN("Failed to invalidate sudo credential: " +
               trim(out.stderr_text));
    } else {
      LOG_DEBUG("Privilege released");
    }
  } catch (const std::exception &e) {
    LOG_WARN(std::string("Failed to invalidate sudo credential: ") + e.what());
  } catch (...) {
    LOG_WARN("Failed to invalidate sudo credential: unknown exception");
  }
}

CommandOutput PrivilegeContext::run(const std::string &cmd,
                                    const std::vector<std::string> &args) {
  if (!is_valid(runner_)) {
    throw Error::not_validated();
  }
  std::vector<std::string> full_args;
  full_args.reserve(args.size() + 1);
  full_args.push_back(cmd);
  full_args.insert(full_args.end(), args.begin(), args.end());
  return runner_.run(TOOL_SUDO, full_args);
}

bool PrivilegeContext::is_valid(CommandRunner &runner) {
  return runner.run(TOOL_SUDO, {"-n", "true"}).success();
}

bool PrivilegeClassifier::requires_privilege(const std::string &kind,
                                             const std::string &id) const {
  if (is_package_kind(kind) || kind == "package") {
    return config_.privileged_packages.count(id) > 0;
  }
  if (kind == KIND_PREFERENCE) {
    return config_.privileged_preferences.count(id) > 0;
  }
  return false;
}

bool PrivilegeClassifier::requires_privilege(const Resource &resource) const {
  return resource.privilege_hint().required ||
         requires_privilege(resource.kind(), resource.id());
}

} // namespace converge
