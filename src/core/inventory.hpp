// core/inventory.hpp - Resource inventory from the configuration
#pragma once

#include "../conf/config.hpp"
#include "privilege.hpp"
#include "resource.hpp"
#include "retry.hpp"
#include "runner.hpp"
#include <vector>

namespace converge {

// Packages, preferences, symlinks, file handlers, dock apps, dock folders,
// each in document order. Services are materialized by the executor.
std::vector<ResourcePtr> build_resources(const Config &config,
                                         CommandRunner &runner,
                                         const RetryPolicy &retry);

PrivilegeClassifier make_classifier(const Config &config);

RetryPolicy make_retry_policy(const Settings &settings);

} // namespace converge
