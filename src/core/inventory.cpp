// core/inventory.cpp - Resource inventory implementation
#include "inventory.hpp"
#include "../defs.hpp"
#include "../resource/dock.hpp"
#include "../resource/extension.hpp"
#include "../resource/handler.hpp"
#include "../resource/package.hpp"
#include "../resource/preference.hpp"
#include "../resource/symlink.hpp"
#include "../utils.hpp"
#include <memory>

namespace converge {

std::vector<ResourcePtr> build_resources(const Config &config,
                                         CommandRunner &runner,
                                         const RetryPolicy &retry) {
  std::vector<ResourcePtr> resources;

  for (const auto &pkg : config.packages) {
    if (pkg.kind == KIND_EDITOR_EXTENSION || pkg.kind == KIND_CLI_EXTENSION) {
      resources.push_back(
          std::make_shared<ExtensionResource>(pkg.kind, pkg.name, runner, retry));
    } else {
      resources.push_back(std::make_shared<PackageResource>(pkg, runner, retry));
    }
  }

  for (const auto &pref : config.preferences) {
    resources.push_back(std::make_shared<PreferenceResource>(
        pref, config.service_for_domain(pref.domain), runner));
  }

  for (const auto &link : config.symlinks) {
    resources.push_back(std::make_shared<SymlinkResource>(link));
  }

  for (const auto &handler : config.file_handlers) {
    resources.push_back(std::make_shared<FileHandlerResource>(handler, runner));
  }

  std::string dock_service = config.service_for_domain("com.apple.dock");
  for (const auto &app : config.dock.apps) {
    resources.push_back(
        std::make_shared<DockAppResource>(app, dock_service, runner));
  }
  for (const auto &folder : config.dock.folders) {
    resources.push_back(
        std::make_shared<DockFolderResource>(folder, dock_service, runner));
  }

  LOG_DEBUG("Inventory: " + std::to_string(resources.size()) + " resources");
  return resources;
}

PrivilegeClassifier make_classifier(const Config &config) {
  ClassifierConfig cc;
  cc.privileged_packages = config.allowlist.packages;
  cc.privileged_preferences = config.allowlist.preferences;
  return PrivilegeClassifier(cc);
}

RetryPolicy make_retry_policy(const Settings &settings) {
  RetryPolicy policy;
  policy.max_attempts = settings.retry_attempts;
  policy.base_delay = std::chrono::milliseconds(settings.retry_delay_ms);
  policy.backoff_factor = 2.0;
  policy.max_delay = std::chrono::milliseconds(MAX_RETRY_DELAY_MS);
  return policy;
}

} // namespace converge
