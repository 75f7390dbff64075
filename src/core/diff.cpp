// core/diff.cpp - Diff computation
#include "diff.hpp"
#include "../utils.hpp"

namespace converge {

static DiffRecord diff_resource(const ResourcePtr &resource,
                                const PrivilegeClassifier &classifier,
                                bool &changed) {
  DiffRecord record;
  record.resource = resource;
  record.resource_id = resource->id();
  record.kind = resource->kind();
  record.description = resource->description();
  record.desired_state = resource->desired_state();
  record.privileged = classifier.requires_privilege(*resource);

  try {
    record.current_state = resource->current_state();
  } catch (const Error &e) {
    LOG_WARN("Inspection failed for " + record.kind + " " + record.resource_id +
             ": " + e.what());
    record.current_state = State::unknown();
    record.inspection_error = e;
  } catch (const std::exception &e) {
    LOG_WARN("Inspection failed for " + record.kind + " " + record.resource_id +
             ": " + e.what());
    record.current_state = State::unknown();
    record.inspection_error = Error::inspection_failed(record.kind, e.what());
  }

  changed = record.inspection_failed() ||
            record.current_state != record.desired_state;
  return record;
}

std::vector<DiffRecord> compute_diffs(const std::vector<ResourcePtr> &resources,
                                      const PrivilegeClassifier &classifier) {
  std::vector<DiffRecord> diffs;
  for (const auto &resource : resources) {
    bool changed = false;
    DiffRecord record = diff_resource(resource, classifier, changed);
    if (changed) {
      diffs.push_back(std::move(record));
    } else {
      LOG_DEBUG("Up to date: " + record.kind + " " + record.resource_id);
    }
  }
  return diffs;
}

DiffSummary summarize(const std::vector<DiffRecord> &diffs) {
  DiffSummary summary;
  for (const auto &d : diffs) {
    if (d.current_state.is_absent() && d.desired_state.is_present()) {
      summary.additions++;
    } else if (d.current_state.is_present() && d.desired_state.is_absent()) {
      summary.removals++;
    } else {
      summary.modifications++;
    }
    if (d.privileged)
      summary.privileged++;
    if (d.inspection_failed())
      summary.inspection_failures++;
  }
  return summary;
}

} // namespace converge
