// core/planner.cpp - Execution planning implementation
#include "planner.hpp"
#include "../conf/config.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <map>

namespace converge {

static const std::map<std::string, std::string> KIND_ALIASES = {
    {"packages", "package"},       {"defaults", "preference"},
    {"preferences", "preference"}, {"symlinks", "symlink"},
    {"services", KIND_SERVICE},    {"handlers", KIND_FILE_HANDLER},
    {"extensions", "extension"}};

static const char *KNOWN_KINDS[] = {
    "package",          "dock",         "extension",
    KIND_FORMULA,       KIND_CASK,      KIND_TAP,
    KIND_STORE_APP,     KIND_EDITOR_EXTENSION,
    KIND_CLI_EXTENSION, KIND_NODE_GLOBAL, KIND_PREFERENCE,
    KIND_SYMLINK,       KIND_SERVICE,   KIND_FILE_HANDLER,
    KIND_DOCK_APP,      KIND_DOCK_FOLDER};

std::string resolve_kind(const std::string &name) {
  std::string lowered = to_lower(name);
  auto alias = KIND_ALIASES.find(lowered);
  if (alias != KIND_ALIASES.end())
    return alias->second;
  for (const char *kind : KNOWN_KINDS) {
    if (lowered == kind)
      return lowered;
  }
  return "";
}

static bool kind_matches(const std::string &target_kind,
                         const std::string &resource_kind) {
  if (target_kind.empty() || target_kind == resource_kind)
    return true;
  if (target_kind == "package")
    return is_package_kind(resource_kind);
  if (target_kind == "dock")
    return resource_kind == KIND_DOCK_APP || resource_kind == KIND_DOCK_FOLDER;
  if (target_kind == "extension")
    return resource_kind == KIND_EDITOR_EXTENSION ||
           resource_kind == KIND_CLI_EXTENSION;
  return false;
}

bool Target::matches(const std::string &resource_kind,
                     const std::string &resource_id) const {
  if (!kind_matches(kind, resource_kind))
    return false;
  return fragment.empty() || resource_id.find(fragment) != std::string::npos;
}

Target parse_target(const std::string &raw) {
  Target target;
  std::string text = trim(raw);
  size_t dot = text.find('.');
  std::string head = dot == std::string::npos ? text : text.substr(0, dot);

  std::string kind = resolve_kind(head);
  if (kind.empty()) {
    // Not a kind: the whole string is an id fragment
    target.fragment = text;
    return target;
  }
  target.kind = kind;
  if (dot != std::string::npos)
    target.fragment = text.substr(dot + 1);
  return target;
}

static void add_post_actions(const Resource &resource,
                             std::vector<std::string> &post_actions) {
  for (const auto &service : resource.post_actions()) {
    if (std::find(post_actions.begin(), post_actions.end(), service) ==
        post_actions.end()) {
      post_actions.push_back(service);
    }
  }
}

ExecutionPlan build_plan(const std::vector<DiffRecord> &diffs,
                         const PrivilegeClassifier &classifier) {
  ExecutionPlan plan;
  for (const auto &diff : diffs) {
    if (diff.privileged || classifier.requires_privilege(*diff.resource)) {
      plan.privileged.push_back(diff.resource);
    } else {
      plan.unprivileged.push_back(diff.resource);
    }
    add_post_actions(*diff.resource, plan.post_actions);
  }

  LOG_DEBUG("Plan: " + std::to_string(plan.unprivileged.size()) +
            " unprivileged, " + std::to_string(plan.privileged.size()) +
            " privileged, " + std::to_string(plan.post_actions.size()) +
            " post-actions");
  return plan;
}

ExecutionPlan filter_plan(const ExecutionPlan &plan, const Target &target) {
  ExecutionPlan filtered;
  std::vector<std::string> contributed;

  auto keep = [&](const std::vector<ResourcePtr> &from,
                  std::vector<ResourcePtr> &to) {
    for (const auto &r : from) {
      if (target.matches(r->kind(), r->id())) {
        to.push_back(r);
        add_post_actions(*r, contributed);
      }
    }
  };
  keep(plan.unprivileged, filtered.unprivileged);
  keep(plan.privileged, filtered.privileged);

  // Keep the original order; a service survives if a kept resource enqueued
  // it or the target names it directly.
  for (const auto &service : plan.post_actions) {
    bool from_resource = std::find(contributed.begin(), contributed.end(),
                                   service) != contributed.end();
    bool named = target.kind == KIND_SERVICE && target.matches(KIND_SERVICE,
                                                               service);
    if (from_resource || named)
      filtered.post_actions.push_back(service);
  }
  return filtered;
}

} // namespace converge
