// core/report.hpp - Console and JSON reporting
#pragma once

#include "diff.hpp"
#include "executor.hpp"
#include "json.hpp"
#include "state.hpp"
#include <iostream>
#include <mutex>
#include <vector>

namespace converge {

void print_diff(const std::vector<DiffRecord> &diffs,
                std::ostream &out = std::cout);
void print_status(const DiffSummary &summary, std::ostream &out = std::cout);
void print_privilege_boundary(const std::vector<DiffRecord> &diffs,
                              std::ostream &out = std::cout);
void print_summary(const Summary &summary, std::ostream &out = std::cout);

json::Value diffs_to_json(const std::vector<DiffRecord> &diffs);
json::Value status_to_json(const DiffSummary &summary);

const char *outcome_symbol(OutcomeKind kind);

class ConsoleProgress : public ProgressReporter {
public:
  explicit ConsoleProgress(bool verbose, std::ostream &out = std::cout)
      : verbose_(verbose), out_(out) {}

  void on_batch_start(std::size_t count, bool privileged) override;
  void on_resource_start(const Resource &resource) override;
  void on_resource_complete(const Resource &resource,
                            const Outcome &outcome) override;
  void on_batch_complete(bool privileged) override;
  void on_privilege_boundary(const std::vector<DiffRecord> &diffs) override;

private:
  bool verbose_;
  std::ostream &out_;
  std::mutex mutex_;
};

// Reads y/N from stdin; declines when stdin is not a terminal
class TtyConfirm : public Confirmer {
public:
  bool confirm(const std::string &prompt) override;
};

class AutoConfirm : public Confirmer {
public:
  bool confirm(const std::string &prompt) override;
};

} // namespace converge
