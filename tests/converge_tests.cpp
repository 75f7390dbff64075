#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

#include "conf/config.hpp"
#include "conf/paths.hpp"
#include "conf/toml.hpp"
#include "core/diff.hpp"
#include "core/error.hpp"
#include "core/executor.hpp"
#include "core/inventory.hpp"
#include "core/json.hpp"
#include "core/planner.hpp"
#include "core/privilege.hpp"
#include "core/report.hpp"
#include "core/retry.hpp"
#include "core/runner.hpp"
#include "core/state.hpp"
#include "defs.hpp"
#include "resource/dock.hpp"
#include "resource/extension.hpp"
#include "resource/handler.hpp"
#include "resource/package.hpp"
#include "resource/preference.hpp"
#include "resource/service.hpp"
#include "resource/symlink.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace converge;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

template <typename Fn>
bool throws_kind(ErrorKind kind, Fn&& fn) {
  try {
    fn();
  } catch (const Error& e) {
    return e.kind() == kind;
  }
  return false;
}

fs::path make_temp_dir(const std::string& name) {
  fs::path dir = fs::temp_directory_path() /
                 ("converge_test_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void write_file(const fs::path& path, const std::string& content) {
  std::ofstream out(path);
  out << content;
}

// Scripted stand-in for the external tools. Responses are keyed by the full
// command line; a queue of several responses is consumed one per call and the
// last one repeats. Unscripted commands succeed with no output.
class FakeRunner : public CommandRunner {
 public:
  bool sudo_accepts = true;

  void on(const std::string& command_line, int exit_code, const std::string& out,
          const std::string& err = "") {
    CommandOutput o;
    o.exit_code = exit_code;
    o.stdout_text = out;
    o.stderr_text = err;
    responses_[command_line].push_back(o);
  }

  void missing(const std::string& command_line) {
    CommandOutput o;
    o.exit_code = 127;
    o.spawn_failed = true;
    responses_[command_line].push_back(o);
  }

  CommandOutput run(const std::string& cmd, const std::vector<std::string>& args) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string line = format_command(cmd, args);
    calls_.push_back(line);

    if (cmd == "sudo" && args == std::vector<std::string>{"-n", "true"}) {
      CommandOutput o;
      o.exit_code = credential_cached_ ? 0 : 1;
      return o;
    }
    if (cmd == "sudo" && args == std::vector<std::string>{"-k"}) {
      credential_cached_ = false;
      CommandOutput o;
      o.exit_code = 0;
      return o;
    }

    auto it = responses_.find(line);
    if (it == responses_.end() || it->second.empty()) {
      CommandOutput o;
      o.exit_code = 0;
      return o;
    }
    CommandOutput o = it->second.front();
    if (it->second.size() > 1) it->second.pop_front();
    return o;
  }

  int run_interactive(const std::string& cmd, const std::vector<std::string>& args) override {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(format_command(cmd, args));
    if (cmd == "sudo" && args == std::vector<std::string>{"-v"}) {
      credential_cached_ = sudo_accepts;
      return sudo_accepts ? 0 : 1;
    }
    return 0;
  }

  std::vector<std::string> calls() {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  std::size_t count(const std::string& command_line) {
    auto all = calls();
    return static_cast<std::size_t>(std::count(all.begin(), all.end(), command_line));
  }

  bool called(const std::string& command_line) { return count(command_line) > 0; }

  // Index of the first call equal to command_line, or -1
  long index_of(const std::string& command_line) {
    auto all = calls();
    auto it = std::find(all.begin(), all.end(), command_line);
    return it == all.end() ? -1 : static_cast<long>(it - all.begin());
  }

  bool any_prefix(const std::string& prefix) {
    for (const auto& c : calls()) {
      if (c.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
  }

 private:
  std::mutex mutex_;
  std::map<std::string, std::deque<CommandOutput>> responses_;
  std::vector<std::string> calls_;
  bool credential_cached_ = false;
};

// Dropping the credential fails with an exception
class ThrowingReleaseRunner : public FakeRunner {
 public:
  CommandOutput run(const std::string& cmd, const std::vector<std::string>& args) override {
    if (cmd == "sudo" && args == std::vector<std::string>{"-k"}) {
      release_attempts++;
      throw std::runtime_error("sudo vanished");
    }
    return FakeRunner::run(cmd, args);
  }

  std::atomic<int> release_attempts{0};
};

class ScriptedConfirm : public Confirmer {
 public:
  explicit ScriptedConfirm(std::vector<bool> answers) : answers_(std::move(answers)) {}

  bool confirm(const std::string& prompt) override {
    prompts.push_back(prompt);
    if (answers_.empty()) return false;
    bool answer = answers_.front();
    answers_.erase(answers_.begin());
    return answer;
  }

  std::vector<std::string> prompts;

 private:
  std::vector<bool> answers_;
};

class RecordingProgress : public ProgressReporter {
 public:
  void on_batch_start(std::size_t count, bool privileged) override {
    std::lock_guard<std::mutex> lock(mutex_);
    batches.push_back(std::to_string(count) + (privileged ? ":privileged" : ":normal"));
  }
  void on_resource_start(const Resource&) override { started++; }
  void on_resource_complete(const Resource& resource, const Outcome& outcome) override {
    std::lock_guard<std::mutex> lock(mutex_);
    completed[resource.id()] = outcome.kind;
  }
  void on_batch_complete(bool) override {}
  void on_privilege_boundary(const std::vector<DiffRecord>& diffs) override {
    boundary_size = diffs.size();
  }

  std::atomic<int> started{0};
  std::size_t boundary_size = 0;
  std::vector<std::string> batches;
  std::map<std::string, OutcomeKind> completed;

 private:
  std::mutex mutex_;
};

class FakeResource : public Resource {
 public:
  FakeResource(std::string kind, std::string id, State current, State desired)
      : kind_(std::move(kind)), id_(std::move(id)), current_(current), desired_(desired) {}

  std::string id() const override { return id_; }
  std::string kind() const override { return kind_; }
  std::string description() const override { return kind_ + " " + id_; }
  State desired_state() const override { return desired_; }
  State current_state() override {
    if (fail_inspection) throw Error::inspection_failed(kind_, "read failed");
    return current_;
  }
  Outcome apply(const ApplyContext& ctx) override {
    applies++;
    if (ctx.dry_run) return Outcome::skipped("dry-run");
    if (throw_on_apply) throw std::runtime_error("exploded");
    if (throw_int_on_apply) throw 42;
    saw_privilege = ctx.privileged_runner != nullptr;
    if (current_ == desired_) return Outcome::no_change();
    current_ = desired_;
    return Outcome::created();
  }
  std::vector<std::string> post_actions() const override { return services; }

  bool fail_inspection = false;
  bool throw_on_apply = false;
  bool throw_int_on_apply = false;
  bool saw_privilege = false;
  std::atomic<int> applies{0};
  std::vector<std::string> services;

 private:
  std::string kind_;
  std::string id_;
  State current_;
  State desired_;
};

const std::string NOT_INSTALLED_FORMULA = R"({"formulae":[{"name":"x","installed":[]}],"casks":[]})";
const std::string INSTALLED_FORMULA =
    R"({"formulae":[{"name":"x","installed":[{"version":"1.0"}]}],"casks":[]})";

std::vector<DiffRecord> diffs_for(const Config& config, FakeRunner& runner) {
  auto resources = build_resources(config, runner, RetryPolicy::none());
  return compute_diffs(resources, make_classifier(config));
}

Summary converge_config(const Config& config, FakeRunner& runner, Confirmer& confirm,
                        const ExecuteOptions& opts, const std::string& target = "",
                        RecordingProgress* progress_out = nullptr) {
  auto classifier = make_classifier(config);
  auto resources = build_resources(config, runner, RetryPolicy::none());
  auto diffs = compute_diffs(resources, classifier);
  ExecutionPlan plan = build_plan(diffs, classifier);
  if (!target.empty()) plan = filter_plan(plan, parse_target(target));
  RecordingProgress local;
  RecordingProgress& progress = progress_out ? *progress_out : local;
  return execute_plan(plan, opts, runner, progress, confirm);
}

// ---------------------------------------------------------------------------
// State and errors

void test_state_equality() {
  expect(State::absent() == State::absent(), "absent equals absent");
  expect(State::present("1.0") == State::present("1.0"), "same details equal");
  expect(State::present("1.0") != State::present("2.0"), "different details differ");
  expect(State::present() != State::present("1.0"), "missing details differ");
  expect(State::present("x") != State::modified("x", "y"), "variants differ");
  expect(State::unknown() != State::absent(), "unknown differs from absent");
  expect(State::modified("a", "b") == State::modified("a", "b"), "modified equal");
}

void test_outcome_summary_counts() {
  Summary s;
  s.record("a", "formula", Outcome::created());
  s.record("b", "formula", Outcome::failed(Error::not_found("b")));
  s.record("c", "formula", Outcome::skipped("dry-run"));
  s.record("d", "formula", Outcome::no_change());
  s.record("e", "symlink", Outcome::modified());
  expect(s.created == 1 && s.failed == 1 && s.skipped == 1, "bucket counts");
  expect(s.no_change == 1 && s.modified == 1, "remaining counts");
  expect(s.total() == 5, "total");
  expect(!s.success(), "failure recorded");
  expect(s.failures.size() == 1 && s.failures[0].resource_id == "b", "failure detail");
}

void test_install_error_classification() {
  auto kind_of = [](const std::string& err) { return classify_install_error(err, "pkg").kind(); };
  expect(kind_of("curl: (6) Could not resolve host") == ErrorKind::Network, "curl is network");
  expect(kind_of("Error: SHA256 mismatch") == ErrorKind::Network, "sha mismatch is network");
  expect(kind_of("Error: No available formula with the name \"pkg\"") == ErrorKind::NotFound,
         "no available formula");
  expect(kind_of("Error: Unknown command") == ErrorKind::NotFound, "unknown");
  expect(kind_of("Warning: pkg 1.0 is already installed") == ErrorKind::AlreadyInstalled,
         "already installed");
  expect(kind_of("Error: Permission denied @ dir_s_mkdir") == ErrorKind::Permission,
         "permission denied");
  expect(kind_of("Error: Cannot install pkg because conflicting formulae are installed.\n"
                 "  other: because both install `x`\nconflicts with other") ==
             ErrorKind::Conflict,
         "conflicts with");
  expect(kind_of("Error: something odd happened") == ErrorKind::CommandFailed, "fallback");

  expect(Error::network("x").retryable(), "network retryable");
  expect(!Error::not_found("x").retryable(), "not found is final");
  expect(Error::already_installed("x").ignorable(), "already installed ignorable");
  expect(!Error::conflict("x").ignorable(), "conflict not ignorable");
  expect(std::string(error_kind_name(ErrorKind::PrivilegeDenied)) == "privilege-denied",
         "kind name");
}

void test_stderr_tail() {
  std::string text = "1\n2\n\n3\n4\n5\n6\n7\n";
  expect(stderr_tail(text, 5) == "3\n4\n5\n6\n7", "last five non-empty lines");
  expect(stderr_tail("only\n", 5) == "only", "short input kept");
  Error e = Error::command_failed("brew install x", "boom");
  expect(e.field("cmd") == "brew install x" && e.field("stderr_tail") == "boom",
         "fields accessible");
}

// ---------------------------------------------------------------------------
// Retry

void test_retry_backoff() {
  RetryPolicy p;
  p.max_attempts = 5;
  p.base_delay = std::chrono::milliseconds(100);
  p.backoff_factor = 2.0;
  p.max_delay = std::chrono::milliseconds(300);
  expect(p.delay_for_attempt(1).count() == 100, "first delay is base");
  expect(p.delay_for_attempt(2).count() == 200, "second delay doubles");
  expect(p.delay_for_attempt(3).count() == 300, "third delay capped");
  expect(p.delay_for_attempt(4).count() == 300, "stays capped");
}

void test_retry_only_retryable() {
  RetryPolicy p;
  p.max_attempts = 3;

  int calls = 0;
  int result = with_retry(p, "flaky", [&]() {
    calls++;
    if (calls < 3) throw Error::network("timeout");
    return 42;
  });
  expect(result == 42 && calls == 3, "network errors retried until success");

  calls = 0;
  bool not_found = throws_kind(ErrorKind::NotFound, [&]() {
    with_retry(p, "missing", [&]() {
      calls++;
      throw Error::not_found("x");
    });
  });
  expect(not_found && calls == 1, "non-retryable error thrown immediately");

  calls = 0;
  bool exhausted = throws_kind(ErrorKind::Network, [&]() {
    with_retry(p, "down", [&]() {
      calls++;
      throw Error::network("down");
    });
  });
  expect(exhausted && calls == 3, "last error rethrown after max attempts");
}

// ---------------------------------------------------------------------------
// Paths and configuration

void test_expand_path() {
  setenv("HOME", "/home/tester", 1);
  setenv("CONVERGE_TEST_VAR", "/srv/data", 1);
  unsetenv("CONVERGE_TEST_UNSET");

  std::map<std::string, std::string> locations = {{"root", "/opt"},
                                                  {"cfg", "${locations.root}/cfg"}};
  expect(expand_path("~/.zshrc", locations) == "/home/tester/.zshrc", "tilde");
  expect(expand_path("~", locations) == "/home/tester", "bare tilde");
  expect(expand_path("$CONVERGE_TEST_VAR/x", locations) == "/srv/data/x", "env var");
  expect(expand_path("${CONVERGE_TEST_VAR}/y", locations) == "/srv/data/y", "braced env var");
  expect(expand_path("${locations.cfg}/a", locations) == "/opt/cfg/a", "nested location");
  expect(expand_path("$CONVERGE_TEST_UNSET/z", locations) == "$CONVERGE_TEST_UNSET/z",
         "unknown env var kept verbatim");
  expect(expand_path("/plain/path", locations) == "/plain/path", "plain path unchanged");

  expect(throws_kind(ErrorKind::InvalidConfig,
                     [&]() { expand_path("${locations.nope}", locations); }),
         "unknown location rejected");

  std::map<std::string, std::string> cyclic = {{"a", "${locations.b}"}, {"b", "${locations.a}"}};
  bool too_deep = false;
  try {
    expand_path("${locations.a}", cyclic);
  } catch (const Error& e) {
    too_deep = e.kind() == ErrorKind::InvalidConfig &&
               e.field("why") == "location expansion too deep";
  }
  expect(too_deep, "cycle bounded");
}

void test_state_and_config_dirs() {
  setenv("CONVERGE_CONFIG_DIR", "/tmp/cfgdir", 1);
  setenv("CONVERGE_STATE_DIR", "/tmp/statedir", 1);
  expect(default_config_path() == fs::path("/tmp/cfgdir/config.toml"), "config override");
  expect(state_dir() == fs::path("/tmp/statedir"), "state override");
  unsetenv("CONVERGE_CONFIG_DIR");
  unsetenv("CONVERGE_STATE_DIR");
  setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
  expect(config_dir() == fs::path("/tmp/xdg/converge"), "xdg config");
  unsetenv("XDG_CONFIG_HOME");
  setenv("HOME", "/home/tester", 1);
  unsetenv("XDG_STATE_HOME");
  expect(state_dir() == fs::path("/home/tester/.local/state/converge"), "home fallback");
}

void test_toml_subset() {
  json::Value doc = parse_toml(R"TOML(
# comment
title = "demo"   # trailing comment
count = 1_000
ratio = 0.5
enabled = true
list = [
  "a",  # first
  'b',
]

[table]
key = "value"
inline = { x = 1, y = "two" }

[[items]]
name = "first"

[[items]]
name = "second"
tags = ["t1", "t2"]
)TOML");

  expect(doc["title"].as_string() == "demo", "string");
  expect(doc["count"].is_integer() && doc["count"].as_int() == 1000, "integer with underscores");
  expect(!doc["ratio"].is_integer() && doc["ratio"].as_double() == 0.5, "float");
  expect(doc["enabled"].as_bool(), "bool");
  expect(doc["list"].size() == 2 && doc["list"][1].as_string() == "b", "multi-line array");
  expect(doc["table"]["key"].as_string() == "value", "table");
  expect(doc["table"]["inline"]["y"].as_string() == "two", "inline table");
  expect(doc["items"].size() == 2, "array of tables");
  expect(doc["items"][1].find("tags")->size() == 2, "nested array in array table");

  bool located = false;
  try {
    parse_toml("a = 1\nb = \n");
  } catch (const Error& e) {
    located = e.kind() == ErrorKind::InvalidConfig && e.field("where") == "line 2";
  }
  expect(located, "parse error reports line");

  expect(throws_kind(ErrorKind::InvalidConfig, []() { parse_toml("a = 1\na = 2\n"); }),
         "duplicate key rejected");
}

const char* FULL_CONFIG = R"TOML(
services = ["Finder", { name = "Browser", domains = ["com.example.browser"] }]

[locations]
dotfiles = "/opt/dotfiles"

[[packages]]
kind = "formula"
name = "ripgrep"
version = "14.1.0"

[[packages]]
kind = "cask"
name = "docker"
privileged = true

[[preferences]]
domain = "com.apple.finder"
key = "ShowPathbar"
type = "bool"
value = true

[[preferences]]
domain = "com.example.browser"
key = "Zoom"
value = 1.25

[[preferences]]
domain = "com.example.other"
key = "Name"
value = "x"
surprise = 1

[[symlinks]]
source = "${locations.dotfiles}/zshrc"
target = "/tmp/home/.zshrc"
force = true

[[file_handlers]]
bundle_id = "com.microsoft.VSCode"
uti = "public.plain-text"

[dock]
apps = ["/Applications/Safari.app"]
folders = [{ path = "/tmp/Downloads", view = "fan" }]

[privilege_allowlist]
preferences = ["com.example.other.Name"]

[settings]
jobs = 8
retry_attempts = 2
)TOML";

void test_config_document() {
  Config config = Config::from_toml(FULL_CONFIG);

  expect(config.packages.size() == 2, "packages read");
  expect(config.packages[0].version == "14.1.0", "version kept");
  expect(config.packages[1].privileged && config.allowlist.packages.count("docker") == 1,
         "privileged package joins allowlist");

  expect(config.preferences.size() == 3, "preferences read");
  expect(config.preferences[0].value.type == PreferenceType::Bool, "declared bool");
  expect(config.preferences[1].value.type == PreferenceType::Float, "inferred float");
  expect(config.preferences[2].privileged, "allowlisted preference marked privileged");

  expect(config.symlinks.size() == 1 &&
             config.symlinks[0].source == fs::path("/opt/dotfiles/zshrc"),
         "symlink source expanded");
  expect(config.symlinks[0].force, "force flag");

  expect(config.services.size() == 2 && config.services[1].name == "Browser", "services");
  expect(config.service_for_domain("com.apple.finder") == "Finder", "builtin owner declared");
  expect(config.service_for_domain("com.apple.dock").empty(), "undeclared owner ignored");
  expect(config.service_for_domain("com.example.browser") == "Browser", "explicit domains");

  expect(config.file_handlers.size() == 1, "file handlers");
  expect(config.dock.apps.size() == 1 && config.dock.folders.size() == 1, "dock");
  expect(config.dock.folders[0].view == "fan" && config.dock.folders[0].sort == "dateadded",
         "dock folder options with defaults");

  expect(config.settings.jobs == 8 && config.settings.retry_attempts == 2, "settings");
  expect(config.settings.retry_delay_ms == DEFAULT_RETRY_DELAY_MS, "default retry delay");

  config.merge_with_cli(3, true);
  expect(config.settings.jobs == 3 && config.verbose, "cli overrides");
}

void test_config_errors() {
  expect(throws_kind(ErrorKind::InvalidConfig,
                     []() {
                       Config::from_toml("[[packages]]\nkind = \"formula\"\nname = \"a\"\n"
                                         "[[packages]]\nkind = \"formula\"\nname = \"a\"\n");
                     }),
         "duplicate (kind, id) rejected");
  expect(throws_kind(ErrorKind::InvalidConfig,
                     []() { Config::from_toml("[[packages]]\nkind = \"formula\"\n"); }),
         "missing name rejected");
  expect(throws_kind(ErrorKind::InvalidConfig,
                     []() { Config::from_toml("[[packages]]\nkind = \"rpm\"\nname = \"a\"\n"); }),
         "unknown package kind rejected");
  expect(throws_kind(ErrorKind::InvalidConfig,
                     []() {
                       Config::from_toml(
                           "[[preferences]]\ndomain = \"d\"\nkey = \"k\"\ntype = \"int\"\n"
                           "value = \"nope\"\n");
                     }),
         "value/type mismatch rejected");
  expect(throws_kind(ErrorKind::InvalidConfig,
                     []() { Config::from_file("/nonexistent/converge/config.toml"); }),
         "missing file rejected");

  // Same name under two kinds is fine
  Config ok = Config::from_toml(
      "[[packages]]\nkind = \"formula\"\nname = \"a\"\n"
      "[[packages]]\nkind = \"cask\"\nname = \"a\"\n");
  expect(ok.packages.size() == 2, "kind scopes the id");
}

void test_preference_value_parsing() {
  PreferenceValue v;
  expect(PreferenceValue::parse(PreferenceType::Bool, "1\n", v) && v.bool_value, "bool 1");
  expect(PreferenceValue::parse(PreferenceType::Bool, "false", v) && !v.bool_value, "bool false");
  expect(!PreferenceValue::parse(PreferenceType::Bool, "maybe", v), "bool garbage");
  expect(PreferenceValue::parse(PreferenceType::Int, "42\n", v) && v.int_value == 42, "int");
  expect(!PreferenceValue::parse(PreferenceType::Int, "4.2", v), "int rejects float");
  expect(PreferenceValue::parse(PreferenceType::Float, "1.25", v) && v.canonical() == "1.25",
         "float canonical");
  expect(PreferenceValue::of_bool(true).canonical() == "true", "bool canonical");
  expect(std::string(PreferenceValue::of_int(1).write_flag()) == "-int", "write flag");
}

// ---------------------------------------------------------------------------
// Classifier, diff, planner

void test_classifier() {
  ClassifierConfig cc;
  cc.privileged_packages = {"docker"};
  cc.privileged_preferences = {"com.apple.loginwindow.GuestEnabled"};
  PrivilegeClassifier classifier(cc);

  expect(classifier.requires_privilege("cask", "docker"), "package allowlist");
  expect(classifier.requires_privilege("formula", "docker"), "any package kind");
  expect(!classifier.requires_privilege("cask", "firefox"), "unlisted package");
  expect(classifier.requires_privilege("preference", "com.apple.loginwindow.GuestEnabled"),
         "preference allowlist");
  expect(!classifier.requires_privilege("symlink", "docker"), "other kinds never privileged");
  expect(!classifier.requires_privilege("mystery", "x"), "unknown kind defaults to false");
}

void test_compute_diffs() {
  auto same = std::make_shared<FakeResource>("formula", "a", State::present(), State::present());
  auto add = std::make_shared<FakeResource>("formula", "b", State::absent(), State::present());
  auto mod = std::make_shared<FakeResource>("preference", "c", State::modified("0", "1"),
                                            State::present("1"));
  auto broken = std::make_shared<FakeResource>("formula", "d", State::present(), State::present());
  broken->fail_inspection = true;

  ClassifierConfig cc;
  cc.privileged_preferences = {"c"};
  std::vector<ResourcePtr> resources = {same, add, mod, broken};
  auto diffs = compute_diffs(resources, PrivilegeClassifier(cc));

  expect(diffs.size() == 3, "unchanged resource omitted");
  expect(diffs[0].resource_id == "b" && diffs[1].resource_id == "c" && diffs[2].resource_id == "d",
         "input order preserved");
  expect(diffs[1].privileged && !diffs[0].privileged, "privilege flag");
  expect(diffs[2].inspection_failed() && diffs[2].current_state.kind == StateKind::Unknown,
         "inspection failure surfaces as unknown");

  DiffSummary s = summarize(diffs);
  expect(s.additions == 1 && s.modifications == 2 && s.removals == 0, "summary buckets");
  expect(s.privileged == 1 && s.inspection_failures == 1, "summary flags");

  auto removal = std::make_shared<FakeResource>("symlink", "e", State::present("x"), State::absent());
  std::vector<ResourcePtr> only_removal = {removal};
  expect(summarize(compute_diffs(only_removal, PrivilegeClassifier())).removals == 1,
         "removal counted");
}

void test_plan_partition() {
  std::vector<ResourcePtr> resources;
  for (int i = 0; i < 6; ++i) {
    auto r = std::make_shared<FakeResource>(i % 2 ? "preference" : "formula",
                                            "id" + std::to_string(i), State::absent(),
                                            State::present());
    r->services = {i < 3 ? "Finder" : "Dock", "Finder"};
    resources.push_back(r);
  }
  ClassifierConfig cc;
  cc.privileged_packages = {"id0"};
  cc.privileged_preferences = {"id3", "id5"};
  PrivilegeClassifier classifier(cc);

  auto diffs = compute_diffs(resources, classifier);
  ExecutionPlan plan = build_plan(diffs, classifier);
  expect(plan.size() == diffs.size(), "partition is total");
  expect(plan.privileged.size() == 3 && plan.unprivileged.size() == 3, "bucket sizes");
  for (const auto& p : plan.privileged) {
    for (const auto& u : plan.unprivileged) {
      expect(p->id() != u->id(), "buckets disjoint");
    }
  }
  expect(plan.post_actions == std::vector<std::string>({"Finder", "Dock"}),
         "post-actions unique in insertion order");
}

void test_target_parsing_and_filter() {
  Target t = parse_target("packages.rip");
  expect(t.kind == "package" && t.fragment == "rip", "alias with fragment");
  expect(parse_target("defaults").kind == "preference", "defaults alias");
  expect(parse_target("symlinks").kind == "symlink", "symlinks alias");
  expect(parse_target("services").kind == "service", "services alias");
  Target dotted = parse_target("defaults.com.apple.dock");
  expect(dotted.kind == "preference" && dotted.fragment == "com.apple.dock",
         "fragment may contain dots");
  Target bare = parse_target("ripgrep");
  expect(bare.kind.empty() && bare.fragment == "ripgrep", "bare fragment");

  expect(t.matches("formula", "ripgrep") && t.matches("cask", "ripper"), "package category");
  expect(!parse_target("packages.RIP").matches("formula", "ripgrep"),
         "id fragment is case-sensitive");
  Target upper_kind = parse_target("PACKAGES.rip");
  expect(upper_kind.kind == "package" && upper_kind.matches("formula", "ripgrep"),
         "kind head resolves regardless of case");
  expect(!t.matches("preference", "ripgrep"), "kind mismatch");

  std::vector<ResourcePtr> resources = {
      std::make_shared<FakeResource>("formula", "ripgrep", State::absent(), State::present()),
      std::make_shared<FakeResource>("preference", "com.x.Y.Z", State::absent(),
                                     State::present("1")),
      std::make_shared<FakeResource>("cask", "ripcord", State::absent(), State::present())};
  static_cast<FakeResource&>(*resources[1]).services = {"Finder"};
  ClassifierConfig cc;
  cc.privileged_packages = {"ripcord"};
  PrivilegeClassifier classifier(cc);
  ExecutionPlan plan = build_plan(compute_diffs(resources, classifier), classifier);

  ExecutionPlan once = filter_plan(plan, t);
  ExecutionPlan twice = filter_plan(once, t);
  expect(once.unprivileged.size() == 1 && once.unprivileged[0]->id() == "ripgrep",
         "unprivileged kept");
  expect(once.privileged.size() == 1 && once.privileged[0]->id() == "ripcord",
         "privileged kept in its bucket");
  expect(once.post_actions.empty(), "post-action of dropped resource removed");
  expect(twice.unprivileged.size() == once.unprivileged.size() &&
             twice.privileged.size() == once.privileged.size() &&
             twice.post_actions == once.post_actions,
         "filter is idempotent");

  ExecutionPlan prefs = filter_plan(plan, parse_target("defaults"));
  expect(prefs.size() == 1 && prefs.post_actions == std::vector<std::string>({"Finder"}),
         "post-action follows its resource");
}

// ---------------------------------------------------------------------------
// Resources

void test_package_states() {
  FakeRunner runner;
  runner.on("brew info --json=v2 --formula ripgrep", 0, INSTALLED_FORMULA);
  runner.on("brew info --json=v2 --cask firefox", 0,
            R"({"formulae":[],"casks":[{"token":"firefox","installed":"120.0"}]})");
  runner.on("brew info --json=v2 --cask slack", 0,
            R"({"formulae":[],"casks":[{"token":"slack","installed":null}]})");
  runner.on("brew tap", 0, "homebrew/core\nacme/tools\n");
  runner.on("mas list", 0, "497799835  Xcode  (15.0)\n");
  runner.on("pnpm list -g --depth=0", 0, "dependencies:\ntypescript 5.3.3\n");

  auto state_of = [&](const std::string& kind, const std::string& name) {
    PackageEntry e;
    e.kind = kind;
    e.name = name;
    PackageResource r(e, runner, RetryPolicy::none());
    return r.current_state();
  };
  expect(state_of("formula", "ripgrep").is_present(), "formula installed");
  expect(state_of("cask", "firefox").is_present(), "cask installed");
  expect(state_of("cask", "slack").is_absent(), "cask not installed");
  expect(state_of("tap", "acme/tools").is_present(), "tap listed");
  expect(state_of("tap", "other/tap").is_absent(), "tap missing");
  expect(state_of("store-app", "497799835").is_present(), "store app by id");
  expect(state_of("node-global", "typescript").is_present(), "pnpm global");

  runner.missing("brew info --json=v2 --formula jq");
  expect(throws_kind(ErrorKind::Unsupported, [&]() { state_of("formula", "jq"); }),
         "missing tool is unsupported during inspection");
  runner.on("brew info --json=v2 --formula fd", 1, "", "Error: fetch lock held");
  expect(throws_kind(ErrorKind::InspectionFailed, [&]() { state_of("formula", "fd"); }),
         "failed read is an inspection failure");
}

void test_package_apply_paths() {
  FakeRunner runner;
  PackageEntry e;
  e.kind = "formula";
  e.name = "ripgrep";

  // Network failure retried, then success
  runner.on("brew info --json=v2 --formula ripgrep", 0, NOT_INSTALLED_FORMULA);
  runner.on("brew install --formula ripgrep", 1, "", "curl: (28) Operation timed out");
  runner.on("brew install --formula ripgrep", 0, "");
  RetryPolicy retry;
  retry.max_attempts = 3;
  PackageResource r(e, runner, retry);
  Outcome o = r.apply(ApplyContext());
  expect(o.kind == OutcomeKind::Created, "created after retry");
  expect(runner.count("brew install --formula ripgrep") == 2, "one retry");

  // Already installed race is not a failure
  FakeRunner race;
  race.on("brew info --json=v2 --formula ripgrep", 0, NOT_INSTALLED_FORMULA);
  race.on("brew install --formula ripgrep", 1, "", "Warning: ripgrep 14.1.0 is already installed");
  PackageResource r2(e, race, RetryPolicy::none());
  expect(r2.apply(ApplyContext()).kind == OutcomeKind::NoChange, "already installed is no change");

  // Missing tool at apply time
  FakeRunner no_brew;
  no_brew.on("brew info --json=v2 --formula ripgrep", 0, NOT_INSTALLED_FORMULA);
  no_brew.missing("brew install --formula ripgrep");
  PackageResource r3(e, no_brew, RetryPolicy::none());
  expect(throws_kind(ErrorKind::ToolMissing, [&]() { r3.apply(ApplyContext()); }),
         "spawn failure is tool-missing");

  // Idempotent when installed
  FakeRunner done;
  done.on("brew info --json=v2 --formula ripgrep", 0, INSTALLED_FORMULA);
  PackageResource r4(e, done, RetryPolicy::none());
  expect(r4.apply(ApplyContext()).kind == OutcomeKind::NoChange, "installed is no change");
  expect(!done.any_prefix("brew install"), "no install when converged");
}

void test_preference_states() {
  FakeRunner runner;
  PreferenceEntry e;
  e.domain = "com.example.browser";
  e.key = "ShowPathbar";
  e.value = PreferenceValue::of_bool(true);

  runner.on("defaults read com.example.browser ShowPathbar", 0, "1\n");
  PreferenceResource r(e, "", runner);
  expect(r.current_state() == r.desired_state(), "matching value is present");

  FakeRunner drift;
  drift.on("defaults read com.example.browser ShowPathbar", 0, "0\n");
  PreferenceResource r2(e, "", drift);
  State s = r2.current_state();
  expect(s.kind == StateKind::Modified && s.from == "false" && s.to == "true", "drift is modified");

  FakeRunner garbage;
  garbage.on("defaults read com.example.browser ShowPathbar", 0, "{ weird = 1; }\n");
  PreferenceResource r3(e, "", garbage);
  expect(r3.current_state().is_absent(), "unparseable value is absent");

  FakeRunner missing;
  missing.on("defaults read com.example.browser ShowPathbar", 1, "",
             "The domain/default pair of (com.example.browser, ShowPathbar) does not exist");
  PreferenceResource r4(e, "", missing);
  expect(r4.current_state().is_absent(), "missing key is absent");
  expect(r4.apply(ApplyContext()).kind == OutcomeKind::Created, "write of absent key creates");
  expect(missing.called("defaults write com.example.browser ShowPathbar -bool true"),
         "typed write issued");
}

void test_privileged_preference_requires_context() {
  FakeRunner runner;
  PreferenceEntry e;
  e.domain = "com.apple.loginwindow";
  e.key = "GuestEnabled";
  e.value = PreferenceValue::of_bool(false);
  e.privileged = true;
  runner.on("defaults read com.apple.loginwindow GuestEnabled", 0, "1\n");

  PreferenceResource r(e, "", runner);
  expect(throws_kind(ErrorKind::NotValidated, [&]() { r.apply(ApplyContext()); }),
         "privileged write refused without a context");
  expect(!runner.any_prefix("defaults write"), "nothing written directly");
}

void test_symlink_resource() {
  fs::path dir = make_temp_dir("symlink");
  fs::path source = dir / "cfg" / "a";
  fs::path old_source = dir / "old" / "a";
  fs::create_directories(source.parent_path());
  fs::create_directories(old_source.parent_path());
  write_file(source, "new");
  write_file(old_source, "old");

  // Missing target, parents created
  SymlinkEntry fresh{source, dir / "nested" / "deeper" / ".arc", false};
  SymlinkResource create(fresh);
  expect(create.current_state().is_absent(), "missing target is absent");
  expect(create.apply(ApplyContext()).kind == OutcomeKind::Created, "link created");
  expect(create.current_state() == create.desired_state(), "converged after apply");
  expect(create.apply(ApplyContext()).kind == OutcomeKind::NoChange, "second apply is no-op");

  // Wrong target replaced
  fs::path target = dir / ".arc";
  fs::create_symlink(old_source, target);
  SymlinkResource wrong({source, target, false});
  State s = wrong.current_state();
  expect(s.kind == StateKind::Modified && s.from == old_source.string() &&
             s.to == source.string(),
         "wrong target reported");
  expect(wrong.apply(ApplyContext()).kind == OutcomeKind::Modified, "wrong target replaced");
  expect(fs::read_symlink(target) == source, "points to the source");

  // Regular file without force
  fs::path regular = dir / ".regular";
  write_file(regular, "user data");
  SymlinkResource keep({source, regular, false});
  State rs = keep.current_state();
  expect(rs.kind == StateKind::Modified && rs.from == "regular", "regular file reported");
  Outcome skipped = keep.apply(ApplyContext());
  expect(skipped.kind == OutcomeKind::Skipped &&
             skipped.reason.compare(0, 11, "File exists") == 0,
         "regular file not overwritten");
  expect(!is_symlink_path(regular), "file untouched");

  // Regular file with force
  SymlinkResource forced({source, regular, true});
  expect(forced.apply(ApplyContext()).kind == OutcomeKind::Modified, "forced replace");
  expect(fs::exists(dir / ".regular.bak"), "backup kept");
  expect(is_symlink_path(regular), "now a symlink");

  // Missing source
  SymlinkResource broken({dir / "nope", dir / ".nope", false});
  expect(throws_kind(ErrorKind::NotFound, [&]() { broken.apply(ApplyContext()); }),
         "missing source fails");

  // Dry run leaves the filesystem alone
  ApplyContext dry;
  dry.dry_run = true;
  SymlinkResource dry_link({source, dir / ".dry", false});
  expect(dry_link.apply(dry).kind == OutcomeKind::Skipped, "dry-run skipped");
  expect(!path_exists_no_follow(dir / ".dry"), "dry-run created nothing");

  fs::remove_all(dir);
}

void test_service_and_dock() {
  FakeRunner runner;
  ServiceResource finder("Finder", runner);
  expect(finder.needs_apply(), "service always needs apply");
  expect(!finder.parallel_safe(), "service not parallel safe");
  expect(finder.apply(ApplyContext()).kind == OutcomeKind::Modified, "restart issued");
  expect(runner.called("killall Finder"), "killall used");

  runner.on("killall Ghost", 1, "", "No matching processes were found");
  ServiceResource ghost("Ghost", runner);
  Outcome o = ghost.apply(ApplyContext());
  expect(o.kind == OutcomeKind::Skipped && o.reason == "not running", "absent process skipped");

  fs::path dir = make_temp_dir("dock");
  fs::path app = dir / "My App.app";
  fs::create_directories(app);
  FakeRunner dock_runner;
  dock_runner.on("defaults read com.apple.dock persistent-apps", 0,
                 "(\n { \"tile-data\" = { \"file-data\" = { \"_CFURLString\" = "
                 "\"file:///Applications/Safari.app/\"; }; }; }\n)\n");
  DockAppResource entry(app, "Dock", dock_runner);
  expect(entry.current_state().is_absent(), "app not in dock");
  expect(!entry.parallel_safe(), "dock not parallel safe");
  expect(entry.post_actions() == std::vector<std::string>({"Dock"}), "dock restart enqueued");
  expect(entry.apply(ApplyContext()).kind == OutcomeKind::Created, "app added");
  expect(dock_runner.called(format_command("dockutil", {"--add", app.string(), "--no-restart"})),
         "dockutil add");

  DockAppResource safari("/Applications/Safari.app", "", dock_runner);
  expect(safari.current_state().is_present(), "existing entry found by url");
  expect(dock_file_url(app).find("My%20App.app") != std::string::npos, "url encoding");
  fs::remove_all(dir);
}

void test_extensions_and_handlers() {
  FakeRunner runner;
  runner.on("code --list-extensions", 0, "ms-python.python\nrust-lang.rust-analyzer\n");
  runner.on("gh extension list", 0, "gh dash\tdlvhdr/gh-dash\tv4.0.0\n");

  ExtensionResource python(KIND_EDITOR_EXTENSION, "MS-Python.python", runner,
                           RetryPolicy::none());
  expect(python.current_state().is_present(), "editor extension matched ignoring case");
  ExtensionResource go(KIND_EDITOR_EXTENSION, "golang.go", runner, RetryPolicy::none());
  expect(go.apply(ApplyContext()).kind == OutcomeKind::Created, "editor extension installed");
  expect(runner.called("code --install-extension golang.go --force"), "code install");

  ExtensionResource dash(KIND_CLI_EXTENSION, "dlvhdr/gh-dash", runner, RetryPolicy::none());
  expect(dash.current_state().is_present(), "gh extension matched by token");
  ExtensionResource copilot(KIND_CLI_EXTENSION, "github/gh-copilot", runner,
                            RetryPolicy::none());
  expect(copilot.apply(ApplyContext()).kind == OutcomeKind::Created, "gh extension installed");
  expect(runner.called("gh extension install github/gh-copilot"), "gh install");

  runner.on("duti -x public.plain-text", 0,
            "TextEdit\n/System/Applications/TextEdit.app\ncom.apple.TextEdit\n");
  FileHandlerResource handler({"com.microsoft.VSCode", "public.plain-text"}, runner);
  State s = handler.current_state();
  expect(s.kind == StateKind::Modified && s.from == "com.apple.TextEdit",
         "other handler reported");
  expect(!handler.parallel_safe(), "handlers serialized");
  expect(handler.apply(ApplyContext()).kind == OutcomeKind::Modified, "handler switched");
  expect(runner.called("duti -s com.microsoft.VSCode public.plain-text all"), "duti set");

  runner.on("duti -x public.json", 1, "", "no handler");
  FileHandlerResource unset({"com.microsoft.VSCode", "public.json"}, runner);
  expect(unset.current_state().is_absent(), "no handler is absent");
}

void test_inventory_order() {
  FakeRunner runner;
  Config config = Config::from_toml(FULL_CONFIG);
  auto resources = build_resources(config, runner, RetryPolicy::none());
  std::vector<std::string> kinds;
  for (const auto& r : resources) kinds.push_back(r->kind());
  std::vector<std::string> expected = {"formula",    "cask",       "preference",
                                       "preference", "preference", "symlink",
                                       "file-handler", "dock-app", "dock-folder"};
  expect(kinds == expected, "document order by section");
  expect(resources[2]->post_actions() == std::vector<std::string>({"Finder"}),
         "finder preference restarts Finder");
  expect(resources[3]->post_actions() == std::vector<std::string>({"Browser"}),
         "declared domain restarts Browser");
  expect(resources[4]->post_actions().empty(), "no owner, no restart");
}

// ---------------------------------------------------------------------------
// Executor scenarios

void test_fresh_formula_install() {
  FakeRunner runner;
  runner.on("brew info --json=v2 --formula ripgrep", 0, NOT_INSTALLED_FORMULA);
  Config config = Config::from_toml("[[packages]]\nkind = \"formula\"\nname = \"ripgrep\"\n");

  auto diffs = diffs_for(config, runner);
  expect(diffs.size() == 1 && diffs[0].current_state.is_absent() &&
             diffs[0].desired_state.is_present(),
         "one addition");

  ScriptedConfirm confirm({true});
  ExecuteOptions opts;
  Summary s = converge_config(config, runner, confirm, opts);
  expect(s.created == 1 && s.total() == 1, "created one");
  expect(s.success(), "exit zero");
  expect(runner.called("brew install --formula ripgrep"), "install invoked");
  expect(confirm.prompts.size() == 1 && confirm.prompts[0] == "Apply changes?", "single prompt");
}

void test_up_to_date_preference() {
  FakeRunner runner;
  runner.on("defaults read com.example.browser ShowPathbar", 0, "1\n");
  Config config = Config::from_toml(
      "[[preferences]]\ndomain = \"com.example.browser\"\nkey = \"ShowPathbar\"\n"
      "type = \"bool\"\nvalue = true\n");

  expect(diffs_for(config, runner).empty(), "no diffs");
  ScriptedConfirm confirm({true});
  Summary s = converge_config(config, runner, confirm, ExecuteOptions());
  expect(s.total() == 0 && s.success(), "all zeros");
  expect(confirm.prompts.empty(), "no confirmation when nothing to do");
  expect(!runner.any_prefix("defaults write"), "nothing written");
}

void test_privileged_preference_drift() {
  FakeRunner runner;
  runner.on("defaults read com.example.browser ShowPathbar", 0, "0\n");
  Config config = Config::from_toml(
      "[[services]]\nname = \"Browser\"\ndomains = [\"com.example.browser\"]\n"
      "[[preferences]]\ndomain = \"com.example.browser\"\nkey = \"ShowPathbar\"\n"
      "type = \"bool\"\nvalue = true\n"
      "[privilege_allowlist]\npreferences = [\"com.example.browser.ShowPathbar\"]\n");

  auto diffs = diffs_for(config, runner);
  expect(diffs.size() == 1 && diffs[0].privileged, "privileged diff");

  ScriptedConfirm confirm({true, true});
  RecordingProgress progress;
  Summary s = converge_config(config, runner, confirm, ExecuteOptions(), "", &progress);

  expect(s.modified == 1 && s.total() == 1, "modified once");
  expect(confirm.prompts.size() == 2, "confirmed before apply and at the boundary");
  expect(progress.boundary_size == 1, "boundary shown");
  expect(progress.batches == std::vector<std::string>({"1:privileged"}),
         "unprivileged batch empty");
  expect(runner.called("sudo -v"), "credential acquired");
  expect(runner.called("sudo defaults write com.example.browser ShowPathbar -bool true"),
         "write routed through sudo");
  long released = runner.index_of("sudo -k");
  long restarted = runner.index_of("killall Browser");
  expect(released >= 0 && restarted > released, "privilege released before post-actions");
  expect(!PrivilegeContext::is_valid(runner), "credential invalid after execute");
}

void test_failure_continuation() {
  FakeRunner runner;
  for (const std::string name : {"alpha", "bravo", "charlie"}) {
    if (name == "bravo") {
      runner.on("brew info --json=v2 --formula bravo", 1, "",
                "Error: No available formula with the name \"bravo\".");
      runner.on("brew install --formula bravo", 1, "",
                "Error: No available formula with the name \"bravo\".");
    } else {
      runner.on("brew info --json=v2 --formula " + name, 0, NOT_INSTALLED_FORMULA);
    }
  }
  Config config = Config::from_toml(
      "[[packages]]\nkind = \"formula\"\nname = \"alpha\"\n"
      "[[packages]]\nkind = \"formula\"\nname = \"bravo\"\n"
      "[[packages]]\nkind = \"formula\"\nname = \"charlie\"\n");

  ScriptedConfirm confirm({true});
  ExecuteOptions opts;
  opts.parallelism = 3;
  RecordingProgress progress;
  Summary s = converge_config(config, runner, confirm, opts, "", &progress);

  expect(s.created == 2 && s.failed == 1, "two created one failed");
  expect(!s.success(), "non-zero exit");
  expect(s.failures.size() == 1 && s.failures[0].resource_id == "bravo" &&
             s.failures[0].error.kind() == ErrorKind::NotFound,
         "failure is not-found");
  expect(progress.completed.size() == 3, "every resource completed");
}

void test_target_filter_scenario() {
  FakeRunner runner;
  runner.on("brew info --json=v2 --formula ripgrep", 0, NOT_INSTALLED_FORMULA);
  runner.on("defaults read com.x.Y Z", 0, "0\n");
  Config config = Config::from_toml(
      "[[packages]]\nkind = \"formula\"\nname = \"ripgrep\"\n"
      "[[preferences]]\ndomain = \"com.x.Y\"\nkey = \"Z\"\nvalue = true\n");

  ScriptedConfirm confirm({true});
  RecordingProgress progress;
  Summary s = converge_config(config, runner, confirm, ExecuteOptions(), "packages.rip", &progress);
  expect(s.created == 1 && s.total() == 1, "only the package ran");
  expect(progress.completed.count("com.x.Y.Z") == 0, "preference not applied");
  expect(!runner.any_prefix("defaults write"), "no preference write");
}

void test_declined_confirmation() {
  FakeRunner runner;
  runner.on("brew info --json=v2 --formula ripgrep", 0, NOT_INSTALLED_FORMULA);
  runner.on("brew info --json=v2 --formula fd", 0, NOT_INSTALLED_FORMULA);
  Config config = Config::from_toml(
      "[[packages]]\nkind = \"formula\"\nname = \"ripgrep\"\n"
      "[[packages]]\nkind = \"formula\"\nname = \"fd\"\n");
  ScriptedConfirm confirm({false});
  Summary s = converge_config(config, runner, confirm, ExecuteOptions());
  expect(s.skipped == 2 && s.total() == 2, "all skipped");
  expect(!runner.any_prefix("brew install"), "nothing installed");
}

void test_dry_run_purity() {
  fs::path dir = make_temp_dir("dryrun");
  write_file(dir / "src", "x");

  FakeRunner runner;
  runner.on("brew info --json=v2 --formula ripgrep", 0, NOT_INSTALLED_FORMULA);
  runner.on("defaults read com.apple.finder ShowPathbar", 0, "0\n");
  runner.on("duti -x public.plain-text", 0, "TextEdit\n/Applications/TextEdit.app\ncom.apple.TextEdit\n");
  std::string doc =
      "services = [\"Finder\"]\n"
      "[[packages]]\nkind = \"formula\"\nname = \"ripgrep\"\n"
      "[[preferences]]\ndomain = \"com.apple.finder\"\nkey = \"ShowPathbar\"\nvalue = true\n"
      "[[symlinks]]\nsource = \"" + (dir / "src").string() + "\"\ntarget = \"" +
      (dir / "dst").string() + "\"\n"
      "[[file_handlers]]\nbundle_id = \"com.microsoft.VSCode\"\nuti = \"public.plain-text\"\n"
      "[privilege_allowlist]\npackages = [\"ripgrep\"]\n";
  Config config = Config::from_toml(doc);

  ScriptedConfirm confirm({});
  ExecuteOptions opts;
  opts.dry_run = true;
  Summary s = converge_config(config, runner, confirm, opts);

  expect(s.total() == 0, "empty summary");
  expect(confirm.prompts.empty(), "no prompts in dry run");
  for (const auto& call : runner.calls()) {
    bool read_only = call.compare(0, 9, "brew info") == 0 ||
                     call.compare(0, 13, "defaults read") == 0 ||
                     call.compare(0, 7, "duti -x") == 0;
    expect(read_only, "unexpected mutating call in dry run: " + call);
  }
  expect(!path_exists_no_follow(dir / "dst"), "no symlink created");
  fs::remove_all(dir);
}

void test_privilege_denied() {
  FakeRunner runner;
  runner.sudo_accepts = false;
  runner.on("brew info --json=v2 --formula ripgrep", 0, NOT_INSTALLED_FORMULA);
  runner.on("brew info --json=v2 --cask docker", 0,
            R"({"formulae":[],"casks":[{"token":"docker","installed":null}]})");
  Config config = Config::from_toml(
      "[[packages]]\nkind = \"formula\"\nname = \"ripgrep\"\n"
      "[[packages]]\nkind = \"cask\"\nname = \"docker\"\nprivileged = true\n");

  ScriptedConfirm confirm({true, true});
  Summary s = converge_config(config, runner, confirm, ExecuteOptions());
  expect(s.created == 1, "unprivileged outcome preserved");
  expect(s.failed == 1 && s.privilege_denied, "privileged batch aborted");
  expect(s.failures[0].error.kind() == ErrorKind::PrivilegeDenied, "denial recorded");
  expect(!runner.called("brew install --cask docker"), "privileged install not attempted");
  expect(!PrivilegeContext::is_valid(runner), "no credential left behind");
}

void test_privileged_batch_declined() {
  FakeRunner runner;
  runner.on("brew info --json=v2 --cask docker", 0,
            R"({"formulae":[],"casks":[{"token":"docker","installed":null}]})");
  Config config = Config::from_toml(
      "[[packages]]\nkind = \"cask\"\nname = \"docker\"\nprivileged = true\n");
  ScriptedConfirm confirm({true, false});
  Summary s = converge_config(config, runner, confirm, ExecuteOptions());
  expect(s.skipped == 1 && s.failed == 0, "declined privileged batch skipped");
  expect(!runner.called("sudo -v"), "no credential requested");
}

void test_privilege_released_on_failure() {
  FakeRunner runner;
  auto boom = std::make_shared<FakeResource>("preference", "com.a.B", State::absent(),
                                             State::present("1"));
  boom->throw_on_apply = true;
  auto fine = std::make_shared<FakeResource>("preference", "com.a.C", State::absent(),
                                             State::present("1"));
  ExecutionPlan plan;
  plan.privileged = {boom, fine};

  ScriptedConfirm confirm({true, true});
  RecordingProgress progress;
  Summary s = execute_plan(plan, ExecuteOptions(), runner, progress, confirm);
  expect(s.failed == 1 && s.created == 1, "failure does not abort the batch");
  expect(fine->saw_privilege, "context threaded into apply");
  expect(runner.called("sudo -k"), "credential dropped");
  expect(!PrivilegeContext::is_valid(runner), "credential invalid after failure");
}

void test_inspection_failure_not_applied() {
  auto broken = std::make_shared<FakeResource>("formula", "x", State::absent(), State::present());
  broken->fail_inspection = true;
  auto ok = std::make_shared<FakeResource>("formula", "y", State::absent(), State::present());
  ExecutionPlan plan;
  plan.unprivileged = {broken, ok};

  FakeRunner runner;
  ScriptedConfirm confirm({true});
  RecordingProgress progress;
  Summary s = execute_plan(plan, ExecuteOptions(), runner, progress, confirm);
  expect(s.failed == 1 && s.created == 1, "inspection failure reported");
  expect(broken->applies == 0, "uninspectable resource never applied");
  expect(s.failures[0].error.kind() == ErrorKind::InspectionFailed, "kind preserved");
}

void test_non_standard_throw_contained() {
  auto first = std::make_shared<FakeResource>("formula", "alpha", State::absent(), State::present());
  auto second = std::make_shared<FakeResource>("formula", "bravo", State::absent(), State::present());
  first->throw_int_on_apply = true;
  second->throw_int_on_apply = true;
  ExecutionPlan plan;
  plan.unprivileged = {first, second};

  FakeRunner runner;
  ScriptedConfirm confirm({true});
  RecordingProgress progress;
  ExecuteOptions opts;
  opts.parallelism = 2;
  Summary s = execute_plan(plan, opts, runner, progress, confirm);
  expect(s.failed == 2 && s.total() == 2, "both throws recorded as failures");
  for (const auto& f : s.failures) {
    expect(f.error.kind() == ErrorKind::CommandFailed &&
               f.error.field("stderr_tail") == "unknown exception",
           "non-standard throw described");
  }
  expect(progress.completed.size() == 2, "progress completed for both");

  auto privileged = std::make_shared<FakeResource>("preference", "com.a.B", State::absent(),
                                                   State::present("1"));
  privileged->throw_int_on_apply = true;
  auto after = std::make_shared<FakeResource>("preference", "com.a.C", State::absent(),
                                              State::present("1"));
  ExecutionPlan privileged_plan;
  privileged_plan.privileged = {privileged, after};
  FakeRunner sudo_runner;
  ScriptedConfirm both({true, true});
  Summary ps = execute_plan(privileged_plan, ExecuteOptions(), sudo_runner, progress, both);
  expect(ps.failed == 1 && ps.created == 1, "privileged batch continues past the throw");
  expect(!PrivilegeContext::is_valid(sudo_runner), "credential dropped after the throw");
}

void test_credential_release_failure_contained() {
  auto r = std::make_shared<FakeResource>("preference", "com.a.B", State::absent(),
                                          State::present("1"));
  ExecutionPlan plan;
  plan.privileged = {r};

  ThrowingReleaseRunner runner;
  ScriptedConfirm confirm({true, true});
  RecordingProgress progress;
  Summary s = execute_plan(plan, ExecuteOptions(), runner, progress, confirm);
  expect(s.created == 1 && s.failed == 0, "outcome kept when release throws");
  expect(runner.release_attempts == 1, "release attempted once");
}

void test_restart_only_after_change() {
  // Declined privileged batch restarts nothing
  auto declined = std::make_shared<FakeResource>("preference", "com.apple.finder.ShowPathbar",
                                                 State::modified("0", "1"), State::present("1"));
  declined->services = {"Finder"};
  ExecutionPlan plan;
  plan.privileged = {declined};
  plan.post_actions = {"Finder"};
  FakeRunner runner;
  ScriptedConfirm confirm({true, false});
  RecordingProgress progress;
  Summary s = execute_plan(plan, ExecuteOptions(), runner, progress, confirm);
  expect(s.skipped == 1, "privileged change skipped");
  expect(!runner.called("killall Finder"), "no restart for a declined change");

  // Denied privilege restarts nothing
  FakeRunner refusing;
  refusing.sudo_accepts = false;
  ScriptedConfirm yes({true, true});
  Summary denied = execute_plan(plan, ExecuteOptions(), refusing, progress, yes);
  expect(denied.privilege_denied, "privilege denied");
  expect(!refusing.called("killall Finder"), "no restart when privilege is refused");

  // Only the changed resource's service restarts
  auto broken = std::make_shared<FakeResource>("preference", "com.apple.dock.tilesize",
                                               State::absent(), State::present("36"));
  broken->throw_on_apply = true;
  broken->services = {"Dock"};
  auto changed = std::make_shared<FakeResource>("preference", "com.apple.finder.ShowStatusBar",
                                                State::absent(), State::present("1"));
  changed->services = {"Finder"};
  ExecutionPlan mixed;
  mixed.unprivileged = {broken, changed};
  mixed.post_actions = {"Dock", "Finder", "SystemUIServer"};
  FakeRunner mixed_runner;
  ScriptedConfirm apply({true});
  Summary ms = execute_plan(mixed, ExecuteOptions(), mixed_runner, progress, apply);
  expect(ms.created == 1 && ms.failed == 1, "one change one failure");
  expect(mixed_runner.called("killall Finder"), "changed resource restarts its service");
  expect(!mixed_runner.called("killall Dock"), "failed resource restarts nothing");
  expect(mixed_runner.called("killall SystemUIServer"), "directly named service still runs");
}

void test_parallel_batch_applies_each_once() {
  std::vector<std::shared_ptr<FakeResource>> fakes;
  ExecutionPlan plan;
  for (int i = 0; i < 40; ++i) {
    auto r = std::make_shared<FakeResource>("formula", "pkg" + std::to_string(i),
                                            State::absent(), State::present());
    fakes.push_back(r);
    plan.unprivileged.push_back(r);
  }
  FakeRunner runner;
  ScriptedConfirm confirm({true});
  RecordingProgress progress;
  ExecuteOptions opts;
  opts.parallelism = 8;
  Summary s = execute_plan(plan, opts, runner, progress, confirm);
  expect(s.created == 40, "all created");
  for (const auto& r : fakes) expect(r->applies == 1, "applied exactly once");
  expect(progress.started == 40, "progress for every resource");
}

// ---------------------------------------------------------------------------
// Runner, JSON, reporting

void test_process_runner() {
  ProcessRunner runner;
  CommandOutput out = runner.run("sh", {"-c", "echo hello; echo oops >&2; exit 3"});
  expect(out.exit_code == 3 && !out.success(), "exit code captured");
  expect(out.stdout_text == "hello\n" && out.stderr_text == "oops\n", "both streams captured");

  CommandOutput big = runner.run("sh", {"-c", "head -c 300000 /dev/zero | tr '\\0' a; "
                                              "head -c 300000 /dev/zero | tr '\\0' b >&2"});
  expect(big.success() && big.stdout_text.size() == 300000 && big.stderr_text.size() == 300000,
         "large output drained without deadlock");

  CommandOutput missing = runner.run("converge-no-such-tool-xyz", {});
  expect(missing.spawn_failed && missing.exit_code == 127, "missing tool detected");
  expect(runner.run_interactive("true", {}) == 0, "interactive exit code");
}

void test_json_roundtrip_shapes() {
  json::Value v = json::parse(R"({"a":[1,2.5,"x\n",true,null],"b":{"c":"é"}})");
  expect(v["a"].size() == 5 && v["a"].items().front().as_int() == 1, "array parsed");
  expect(v["a"][1].as_double() == 2.5 && v["a"][2].as_string() == "x\n", "number and escape");
  expect(v["a"][4].is_null(), "null parsed");
  expect(v["b"]["c"].as_string() == "\xc3\xa9", "unicode escape");
  expect(json::dump(json::parse(json::dump(v))) == json::dump(v), "stable dump");

  bool rejected = false;
  try {
    json::parse("{\"a\":}");
  } catch (const std::runtime_error&) {
    rejected = true;
  }
  expect(rejected, "malformed json rejected");
}

void test_report_output() {
  std::vector<DiffRecord> diffs(2);
  diffs[0].resource_id = "ripgrep";
  diffs[0].kind = "formula";
  diffs[0].current_state = State::absent();
  diffs[0].desired_state = State::present();
  diffs[1].resource_id = "com.a.B";
  diffs[1].kind = "preference";
  diffs[1].current_state = State::modified("0", "1");
  diffs[1].desired_state = State::present("1");
  diffs[1].privileged = true;

  std::ostringstream out;
  print_diff(diffs, out);
  std::string text = out.str();
  expect(text.find("+ ripgrep") != std::string::npos, "addition symbol");
  expect(text.find("~ com.a.B") != std::string::npos, "modification symbol");
  expect(text.find("[privileged]") != std::string::npos, "privileged marker");

  json::Value j = diffs_to_json(diffs);
  expect(j["summary"]["additions"].as_int() == 1 && j["summary"]["privileged"].as_int() == 1,
         "json summary");
  const json::Value *current = j["diffs"][1].find("current");
  expect(current && current->find("state")->as_string() == "modified", "json state");

  Summary s;
  s.record("bravo", "formula",
           Outcome::failed(Error::command_failed("brew install bravo", "line1\nline2")));
  std::ostringstream sum;
  print_summary(s, sum);
  expect(sum.str().find("command-failed") != std::string::npos, "failure kind printed");
  expect(sum.str().find("line2") != std::string::npos, "stderr tail printed");
}

}  // namespace

int main() {
  Logger::getInstance().init(false, false, fs::path());

  std::cout << "=== converge Test Suite ===\n";

  std::cout << "\n[State & Errors]\n";
  run_test("state equality", test_state_equality);
  run_test("summary counts", test_outcome_summary_counts);
  run_test("install error classification", test_install_error_classification);
  run_test("stderr tail", test_stderr_tail);

  std::cout << "\n[Retry]\n";
  run_test("backoff schedule", test_retry_backoff);
  run_test("only retryable errors retried", test_retry_only_retryable);

  std::cout << "\n[Configuration]\n";
  run_test("path expansion", test_expand_path);
  run_test("config and state dirs", test_state_and_config_dirs);
  run_test("toml subset", test_toml_subset);
  run_test("config document", test_config_document);
  run_test("config errors", test_config_errors);
  run_test("preference value parsing", test_preference_value_parsing);

  std::cout << "\n[Planning]\n";
  run_test("privilege classifier", test_classifier);
  run_test("diff computation", test_compute_diffs);
  run_test("plan partition", test_plan_partition);
  run_test("target parsing and filter", test_target_parsing_and_filter);

  std::cout << "\n[Resources]\n";
  run_test("package states", test_package_states);
  run_test("package apply paths", test_package_apply_paths);
  run_test("preference states", test_preference_states);
  run_test("privileged preference needs context", test_privileged_preference_requires_context);
  run_test("symlink resource", test_symlink_resource);
  run_test("service and dock", test_service_and_dock);
  run_test("extensions and handlers", test_extensions_and_handlers);
  run_test("inventory order", test_inventory_order);

  std::cout << "\n[Executor]\n";
  run_test("fresh formula install", test_fresh_formula_install);
  run_test("up-to-date preference", test_up_to_date_preference);
  run_test("privileged preference drift", test_privileged_preference_drift);
  run_test("failure continuation", test_failure_continuation);
  run_test("target filter", test_target_filter_scenario);
  run_test("declined confirmation", test_declined_confirmation);
  run_test("dry-run purity", test_dry_run_purity);
  run_test("privilege denied", test_privilege_denied);
  run_test("privileged batch declined", test_privileged_batch_declined);
  run_test("privilege released on failure", test_privilege_released_on_failure);
  run_test("inspection failure not applied", test_inspection_failure_not_applied);
  run_test("parallel batch applies each once", test_parallel_batch_applies_each_once);
  run_test("non-standard throw contained", test_non_standard_throw_contained);
  run_test("credential release failure contained", test_credential_release_failure_contained);
  run_test("restart only after change", test_restart_only_after_change);

  std::cout << "\n[Runner & Reporting]\n";
  run_test("process runner", test_process_runner);
  run_test("json", test_json_roundtrip_shapes);
  run_test("report output", test_report_output);

  std::cout << "\n" << g_tests_passed << "/" << g_tests_run << " tests passed\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
