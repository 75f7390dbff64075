// core/privilege.hpp - Scoped elevated credentials and privilege classification
#pragma once

#include "resource.hpp"
#include "runner.hpp"
#include <set>
#include <utility>
#include <string>
#include <vector>

namespace converge {

// Witnesses a validated sudo credential. Constructing it validates
// interactively; destroying it invalidates the cached credential.
class PrivilegeContext {
public:
  // Throws PrivilegeDenied when validation fails
  PrivilegeContext(CommandRunner &runner, const std::string &reason);
  ~PrivilegeContext();

  PrivilegeContext(const PrivilegeContext &) = delete;
  PrivilegeContext &operator=(const PrivilegeContext &) = delete;

  // Runs cmd through sudo. Throws NotValidated if the credential expired.
  CommandOutput run(const std::string &cmd,
                    const std::vector<std::string> &args);

  // Non-interactive credential check
  static bool is_valid(CommandRunner &runner);

private:
  CommandRunner &runner_;
};

struct ClassifierConfig {
  std::set<std::string> privileged_packages;
  std::set<std::string> privileged_preferences;
};

class PrivilegeClassifier {
public:
  PrivilegeClassifier() = default;
  explicit PrivilegeClassifier(ClassifierConfig config)
      : config_(std::move(config)) {}

  bool requires_privilege(const std::string &kind, const std::string &id) const;
  // Also honors the resource's own hint
  bool requires_privilege(const Resource &resource) const;

  const ClassifierConfig &config() const { return config_; }

private:
  ClassifierConfig config_;
};

} // namespace converge
