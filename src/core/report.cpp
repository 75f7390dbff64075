// core/report.cpp - Reporting implementation
#include "report.hpp"
#include "../utils.hpp"
#include <string>
#include <unistd.h>

namespace converge {

static constexpr std::size_t MAX_BOUNDARY_LINES = 10;

static const char *diff_symbol(const DiffRecord &d) {
  if (d.inspection_failed())
    return "!";
  if (d.current_state.is_absent() && d.desired_state.is_present())
    return "+";
  if (d.current_state.is_present() && d.desired_state.is_absent())
    return "-";
  return "~";
}

void print_diff(const std::vector<DiffRecord> &diffs, std::ostream &out) {
  if (diffs.empty()) {
    out << "Everything is up to date.\n";
    return;
  }

  // Group by kind, in order of first appearance
  std::vector<std::string> kinds;
  for (const auto &d : diffs) {
    bool seen = false;
    for (const auto &k : kinds)
      seen = seen || k == d.kind;
    if (!seen)
      kinds.push_back(d.kind);
  }

  for (const auto &kind : kinds) {
    out << kind << ":\n";
    for (const auto &d : diffs) {
      if (d.kind != kind)
        continue;
      out << "  " << diff_symbol(d) << " " << d.resource_id;
      if (d.inspection_failed()) {
        out << "  (inspection failed: " << d.inspection_error->what() << ")";
      } else if (d.current_state.kind == StateKind::Modified) {
        out << "  (" << d.current_state.from << " -> " << d.current_state.to
            << ")";
      }
      if (d.privileged)
        out << " [privileged]";
      out << "\n";
    }
  }

  DiffSummary s = summarize(diffs);
  out << "\n"
      << s.total() << " change(s): " << s.additions << " to add, "
      << s.modifications << " to modify, " << s.removals << " to remove";
  if (s.privileged > 0)
    out << " (" << s.privileged << " privileged)";
  out << "\n";
}

void print_status(const DiffSummary &summary, std::ostream &out) {
  if (summary.total() == 0) {
    out << "Everything is up to date.\n";
    return;
  }
  out << "Additions:     " << summary.additions << "\n";
  out << "Modifications: " << summary.modifications << "\n";
  out << "Removals:      " << summary.removals << "\n";
  if (summary.privileged > 0)
    out << "Privileged:    " << summary.privileged << "\n";
  if (summary.inspection_failures > 0)
    out << "Uninspectable: " << summary.inspection_failures << "\n";
}

void print_privilege_boundary(const std::vector<DiffRecord> &diffs,
                              std::ostream &out) {
  out << "\nThe following " << diffs.size()
      << " change(s) require administrator privileges:\n";
  std::size_t shown = 0;
  for (const auto &d : diffs) {
    if (shown == MAX_BOUNDARY_LINES) {
      out << "  ... and " << diffs.size() - shown << " more\n";
      break;
    }
    out << "  " << d.description << "\n";
    shown++;
  }
}

void print_summary(const Summary &summary, std::ostream &out) {
  out << "\nSummary:\n";
  out << "  created:   " << summary.created << "\n";
  out << "  modified:  " << summary.modified << "\n";
  out << "  removed:   " << summary.removed << "\n";
  out << "  skipped:   " << summary.skipped << "\n";
  out << "  failed:    " << summary.failed << "\n";
  out << "  no change: " << summary.no_change << "\n";

  if (summary.failures.empty())
    return;
  out << "\nFailures:\n";
  for (const auto &f : summary.failures) {
    out << "  " << f.kind << " " << f.resource_id << ": "
        << error_kind_name(f.error.kind()) << "\n";
    std::string tail = f.error.field("stderr_tail");
    if (tail.empty())
      tail = f.error.what();
    for (const auto &line : split_lines(tail)) {
      out << "      " << line << "\n";
    }
  }
  if (summary.privilege_denied)
    out << "\nAdministrator access was refused.\n";
}

static json::Value state_to_json(const State &s) {
  json::Value v = json::Value::object();
  switch (s.kind) {
  case StateKind::Absent:
    v["state"] = "absent";
    break;
  case StateKind::Present:
    v["state"] = "present";
    if (s.details)
      v["details"] = *s.details;
    break;
  case StateKind::Modified:
    v["state"] = "modified";
    v["from"] = s.from;
    v["to"] = s.to;
    break;
  case StateKind::Unknown:
    v["state"] = "unknown";
    break;
  }
  return v;
}

json::Value diffs_to_json(const std::vector<DiffRecord> &diffs) {
  json::Value root = json::Value::object();
  json::Value list = json::Value::array();
  for (const auto &d : diffs) {
    json::Value item = json::Value::object();
    item["id"] = d.resource_id;
    item["kind"] = d.kind;
    item["description"] = d.description;
    item["current"] = state_to_json(d.current_state);
    item["desired"] = state_to_json(d.desired_state);
    item["privileged"] = d.privileged;
    if (d.inspection_failed()) {
      item["error"] = error_kind_name(d.inspection_error->kind());
      item["message"] = std::string(d.inspection_error->what());
    }
    list.push_back(item);
  }
  root["diffs"] = list;
  root["summary"] = status_to_json(summarize(diffs));
  return root;
}

json::Value status_to_json(const DiffSummary &summary) {
  json::Value v = json::Value::object();
  v["additions"] = summary.additions;
  v["modifications"] = summary.modifications;
  v["removals"] = summary.removals;
  v["privileged"] = summary.privileged;
  v["inspection_failures"] = summary.inspection_failures;
  v["total"] = summary.total();
  return v;
}

const char *outcome_symbol(OutcomeKind kind) {
  switch (kind) {
  case OutcomeKind::Created:
  case OutcomeKind::Modified:
  case OutcomeKind::Removed:
    return "✓";
  case OutcomeKind::NoChange:
    return "○";
  case OutcomeKind::Failed:
    return "✗";
  case OutcomeKind::Skipped:
    return "⊘";
  }
  return "?";
}

void ConsoleProgress::on_batch_start(std::size_t count, bool privileged) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "\n"
       << (privileged ? "Applying privileged changes" : "Applying changes")
       << " (" << count << ")\n";
}

void ConsoleProgress::on_resource_start(const Resource &resource) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "  → " << resource.kind() << " " << resource.id() << "\n";
}

void ConsoleProgress::on_resource_complete(const Resource &resource,
                                           const Outcome &outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "  " << outcome_symbol(outcome.kind) << " " << resource.kind() << " "
       << resource.id() << ": " << outcome_kind_name(outcome.kind);
  if (outcome.kind == OutcomeKind::Skipped && !outcome.reason.empty())
    out_ << " (" << outcome.reason << ")";
  if (outcome.kind == OutcomeKind::Failed && outcome.error)
    out_ << " (" << error_kind_name(outcome.error->kind()) << ")";
  out_ << "\n";
  if (verbose_ && outcome.kind == OutcomeKind::Failed && outcome.error)
    out_ << "      " << outcome.error->what() << "\n";
}

void ConsoleProgress::on_batch_complete(bool privileged) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (verbose_)
    out_ << (privileged ? "Privileged batch done\n" : "Batch done\n");
}

void ConsoleProgress::on_privilege_boundary(
    const std::vector<DiffRecord> &diffs) {
  std::lock_guard<std::mutex> lock(mutex_);
  print_privilege_boundary(diffs, out_);
}

bool TtyConfirm::confirm(const std::string &prompt) {
  if (!isatty(STDIN_FILENO)) {
    LOG_WARN("stdin is not a terminal; declining '" + prompt +
             "' (use --yes)");
    return false;
  }
  std::cout << prompt << " [y/N] " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer))
    return false;
  answer = to_lower(trim(answer));
  return answer == "y" || answer == "yes";
}

bool AutoConfirm::confirm(const std::string &prompt) {
  LOG_DEBUG("Auto-confirmed: " + prompt);
  return true;
}

} // namespace converge
