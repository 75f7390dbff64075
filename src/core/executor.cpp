// core/executor.cpp - Plan execution implementation
#include "executor.hpp"
#include "../resource/service.hpp"
#include "../utils.hpp"
#include "privilege.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

namespace converge {

static Outcome run_one(const DiffRecord &diff, const ApplyContext &ctx,
                       ProgressReporter &progress) {
  Resource &resource = *diff.resource;
  progress.on_resource_start(resource);

  Outcome outcome;
  if (diff.inspection_failed()) {
    // Never apply what could not be inspected
    outcome = Outcome::failed(*diff.inspection_error);
  } else {
    try {
      outcome = resource.apply(ctx);
    } catch (const Error &e) {
      outcome = Outcome::failed(e);
    } catch (const std::exception &e) {
      outcome = Outcome::failed(Error::command_failed(resource.id(), e.what()));
    } catch (...) {
      outcome = Outcome::failed(
          Error::command_failed(resource.id(), "unknown exception"));
    }
  }

  if (outcome.kind == OutcomeKind::Failed) {
    LOG_ERROR(diff.kind + " " + diff.resource_id + ": " + outcome.to_string());
  } else {
    LOG_INFO(diff.kind + " " + diff.resource_id + ": " + outcome.to_string());
  }
  progress.on_resource_complete(resource, outcome);
  return outcome;
}

static void add_restarts(const Resource &resource, const Outcome &outcome,
                         std::vector<std::string> &restarts) {
  if (!outcome.changed())
    return;
  for (const auto &service : resource.post_actions()) {
    if (std::find(restarts.begin(), restarts.end(), service) == restarts.end())
      restarts.push_back(service);
  }
}

static void run_batch(const std::vector<DiffRecord> &diffs,
                      std::size_t parallelism, const ApplyContext &ctx,
                      ProgressReporter &progress, Summary &summary,
                      std::vector<std::string> &restarts) {
  std::vector<const DiffRecord *> parallel;
  std::vector<const DiffRecord *> serial;
  for (const auto &d : diffs) {
    if (d.resource->parallel_safe()) {
      parallel.push_back(&d);
    } else {
      serial.push_back(&d);
    }
  }

  std::mutex summary_mutex;
  std::atomic<std::size_t> next{0};

  auto worker = [&]() {
    while (true) {
      std::size_t index = next.fetch_add(1);
      if (index >= parallel.size())
        break;
      const DiffRecord &d = *parallel[index];
      Outcome outcome = run_one(d, ctx, progress);
      std::lock_guard<std::mutex> lock(summary_mutex);
      summary.record(d.resource_id, d.kind, outcome);
      add_restarts(*d.resource, outcome, restarts);
    }
  };

  std::size_t workers = std::min(std::max<std::size_t>(parallelism, 1),
                                 parallel.size());
  if (workers <= 1) {
    worker();
  } else {
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
      threads.emplace_back(worker);
    }
    for (auto &t : threads) {
      t.join();
    }
  }

  // Resources that touch a serialized OS registry run one at a time
  for (const DiffRecord *d : serial) {
    Outcome outcome = run_one(*d, ctx, progress);
    summary.record(d->resource_id, d->kind, outcome);
    add_restarts(*d->resource, outcome, restarts);
  }
}

static std::vector<DiffRecord> rediff(const std::vector<ResourcePtr> &bucket,
                                      bool privileged) {
  std::vector<DiffRecord> diffs = compute_diffs(bucket, PrivilegeClassifier());
  for (auto &d : diffs) {
    d.privileged = privileged;
  }
  return diffs;
}

// A service runs when a resource that changed enqueued it, or when no
// resource in the plan enqueues it (named directly by the target).
static std::vector<std::string>
services_to_restart(const ExecutionPlan &plan,
                    const std::vector<std::string> &restarts) {
  std::vector<std::string> contributed;
  for (const auto *bucket : {&plan.unprivileged, &plan.privileged}) {
    for (const auto &r : *bucket) {
      for (const auto &service : r->post_actions())
        contributed.push_back(service);
    }
  }

  std::vector<std::string> services;
  for (const auto &service : plan.post_actions) {
    bool changed = std::find(restarts.begin(), restarts.end(), service) !=
                   restarts.end();
    bool named = std::find(contributed.begin(), contributed.end(), service) ==
                 contributed.end();
    if (changed || named) {
      services.push_back(service);
    } else {
      LOG_DEBUG("Skipping restart of " + service + ": nothing changed");
    }
  }
  return services;
}

static void run_post_actions(const std::vector<std::string> &services,
                             CommandRunner &runner, const ApplyContext &ctx,
                             ProgressReporter &progress) {
  for (const auto &name : services) {
    ServiceResource service(name, runner);
    progress.on_resource_start(service);
    Outcome outcome;
    try {
      outcome = service.apply(ctx);
    } catch (const Error &e) {
      outcome = Outcome::failed(e);
    } catch (const std::exception &e) {
      outcome = Outcome::failed(Error::command_failed(name, e.what()));
    }
    if (outcome.kind == OutcomeKind::Failed) {
      LOG_WARN("Restart of " + name + " failed: " + outcome.to_string());
    }
    progress.on_resource_complete(service, outcome);
  }
}

Summary execute_plan(const ExecutionPlan &plan, const ExecuteOptions &opts,
                     CommandRunner &runner, ProgressReporter &progress,
                     Confirmer &confirm) {
  Summary summary;

  // Live state may have moved since the plan was built
  std::vector<DiffRecord> unprivileged = rediff(plan.unprivileged, false);
  std::vector<DiffRecord> privileged = rediff(plan.privileged, true);
  std::size_t total = unprivileged.size() + privileged.size();

  if (total == 0) {
    LOG_INFO("Nothing to do");
    return summary;
  }

  if (!opts.dry_run && !confirm.confirm("Apply changes?")) {
    LOG_INFO("Apply declined");
    summary.skipped = total;
    return summary;
  }

  if (opts.dry_run) {
    LOG_INFO("Dry run: " + std::to_string(total) + " change(s) not applied");
    return summary;
  }

  ApplyContext ctx;
  ctx.dry_run = false;
  ctx.verbose = opts.verbose;
  std::vector<std::string> restarts;

  if (!unprivileged.empty()) {
    progress.on_batch_start(unprivileged.size(), false);
    run_batch(unprivileged, opts.parallelism, ctx, progress, summary,
              restarts);
    progress.on_batch_complete(false);
  }

  if (!privileged.empty()) {
    progress.on_privilege_boundary(privileged);
    std::string prompt = "Proceed with " + std::to_string(privileged.size()) +
                         " privileged operation(s)?";
    if (!confirm.confirm(prompt)) {
      LOG_INFO("Privileged batch declined");
      summary.skipped += privileged.size();
    } else {
      try {
        PrivilegeContext privilege(
            runner, std::to_string(privileged.size()) +
                        " change(s) need administrator rights");
        ApplyContext privileged_ctx = ctx;
        privileged_ctx.privileged_runner = &privilege;

        progress.on_batch_start(privileged.size(), true);
        run_batch(privileged, 1, privileged_ctx, progress, summary, restarts);
        progress.on_batch_complete(true);
      } catch (const Error &e) {
        // Only acquisition throws here; run_batch records its own failures
        LOG_ERROR(std::string("Privileged batch aborted: ") + e.what());
        summary.privilege_denied = true;
        for (const auto &d : privileged) {
          summary.record(d.resource_id, d.kind, Outcome::failed(e));
        }
      }
    }
  }

  run_post_actions(services_to_restart(plan, restarts), runner, ctx, progress);

  LOG_INFO("Summary: created=" + std::to_string(summary.created) +
           " modified=" + std::to_string(summary.modified) +
           " removed=" + std::to_string(summary.removed) +
           " skipped=" + std::to_string(summary.skipped) +
           " failed=" + std::to_string(summary.failed) +
           " no_change=" + std::to_string(summary.no_change));
  return summary;
}

} // namespace converge
