// core/executor.hpp - Plan execution
#pragma once

#include "../defs.hpp"
#include "diff.hpp"
#include "planner.hpp"
#include "runner.hpp"
#include "state.hpp"
#include <string>
#include <vector>

namespace converge {

struct ExecuteOptions {
  bool dry_run = false;
  std::size_t parallelism = DEFAULT_JOBS;
  bool verbose = false;
};

// Called from several worker threads at once; implementations synchronize.
class ProgressReporter {
public:
  virtual ~ProgressReporter() = default;
  virtual void on_batch_start(std::size_t count, bool privileged) = 0;
  virtual void on_resource_start(const Resource &resource) = 0;
  virtual void on_resource_complete(const Resource &resource,
                                    const Outcome &outcome) = 0;
  virtual void on_batch_complete(bool privileged) = 0;
  // Shown before the second confirmation
  virtual void on_privilege_boundary(const std::vector<DiffRecord> &diffs) = 0;
};

class Confirmer {
public:
  virtual ~Confirmer() = default;
  virtual bool confirm(const std::string &prompt) = 0;
};

Summary execute_plan(const ExecutionPlan &plan, const ExecuteOptions &opts,
                     CommandRunner &runner, ProgressReporter &progress,
                     Confirmer &confirm);

} // namespace converge
