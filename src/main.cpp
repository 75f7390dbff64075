// main.cpp - Main entry point
#include <getopt.h>
#include <unistd.h>
#include <cstdlib>
#include <iostream>
#include "conf/config.hpp"
#include "conf/paths.hpp"
#include "core/diff.hpp"
#include "core/error.hpp"
#include "core/executor.hpp"
#include "core/inventory.hpp"
#include "core/json.hpp"
#include "core/planner.hpp"
#include "core/report.hpp"
#include "core/runner.hpp"
#include "defs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace converge;

struct CliOptions {
    std::string config_file;
    std::string command;
    std::string target;
    std::size_t jobs = 0;
    bool dry_run = false;
    bool yes = false;
    bool verbose = false;
    bool json = false;
};

enum { OPT_JSON = 1000 };

static void print_help() {
    std::cout << "Usage: converge [OPTIONS] <command>\n\n";
    std::cout << "Commands:\n";
    std::cout << "  status             Summarize pending changes\n";
    std::cout << "  diff               List every pending change\n";
    std::cout << "  apply              Converge the machine to the configuration\n\n";

    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE       Config file path\n";
    std::cout << "  -n, --dry-run           Show what would change, change nothing\n";
    std::cout << "  -y, --yes               Do not ask for confirmation\n";
    std::cout << "  -j, --jobs N            Parallel workers (default 4)\n";
    std::cout << "  -t, --target T          Limit to kind or kind.id-fragment\n";
    std::cout << "  -v, --verbose           Verbose logging\n";
    std::cout << "      --json              JSON output (status, diff)\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  converge diff                        # Show drift\n";
    std::cout << "  converge apply --target packages.rip # Converge matching packages\n";
    std::cout << "  converge apply -n -t defaults        # Preview preference changes\n";
}

[[noreturn]] static void usage_error(const std::string& message) {
    std::cerr << "converge: " << message << "\n\n";
    print_help();
    exit(EXIT_CONFIG_ERROR);
}

static std::size_t parse_jobs(const char* text) {
    std::string value = text ? text : "";
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        usage_error("--jobs expects a positive number, got '" + value + "'");
    }
    unsigned long jobs = std::strtoul(value.c_str(), nullptr, 10);
    if (jobs == 0) {
        usage_error("--jobs must be at least 1");
    }
    return static_cast<std::size_t>(jobs);
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                           {"dry-run", no_argument, 0, 'n'},
                                           {"yes", no_argument, 0, 'y'},
                                           {"jobs", required_argument, 0, 'j'},
                                           {"target", required_argument, 0, 't'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"json", no_argument, 0, OPT_JSON},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:nyj:t:vh", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 'n':
            opts.dry_run = true;
            break;
        case 'y':
            opts.yes = true;
            break;
        case 'j':
            opts.jobs = parse_jobs(optarg);
            break;
        case 't':
            opts.target = optarg;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case OPT_JSON:
            opts.json = true;
            break;
        case 'h':
            print_help();
            exit(EXIT_OK);
        default:
            print_help();
            exit(EXIT_CONFIG_ERROR);
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
        optind++;
    }
    if (optind < argc) {
        usage_error(std::string("unexpected argument '") + argv[optind] + "'");
    }

    return opts;
}

static Config load_config(const CliOptions& opts) {
    if (!opts.config_file.empty()) {
        return Config::from_file(expand_path(opts.config_file, {}));
    }
    return Config::load_default();
}

int main(int argc, char* argv[]) {
    CliOptions cli = parse_args(argc, argv);

    // Initialize logger globally for all commands
    Logger::getInstance().init(cli.verbose, cli.verbose, state_dir() / LOG_FILENAME);

    if (cli.command.empty()) {
        print_help();
        return EXIT_OK;
    }

    enum class Command { STATUS, DIFF, APPLY, UNKNOWN };

    auto get_command = [](const std::string& cmd) -> Command {
        if (cmd == "status")
            return Command::STATUS;
        if (cmd == "diff")
            return Command::DIFF;
        if (cmd == "apply")
            return Command::APPLY;
        return Command::UNKNOWN;
    };

    Command command = get_command(cli.command);
    if (command == Command::UNKNOWN) {
        usage_error("unknown command '" + cli.command + "'");
    }

    Config config;
    try {
        config = load_config(cli);
        config.merge_with_cli(cli.jobs, cli.verbose);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        LOG_ERROR("Configuration error: " + std::string(e.what()));
        return EXIT_CONFIG_ERROR;
    }

    if (!config.settings.log_file.empty()) {
        Logger::getInstance().init(config.verbose, config.verbose, config.settings.log_file);
    }
    LOG_INFO("converge " + cli.command + " with " + config.source_path.string());

    try {
        ProcessRunner runner;
        RetryPolicy retry = make_retry_policy(config.settings);
        PrivilegeClassifier classifier = make_classifier(config);

        std::vector<ResourcePtr> resources = build_resources(config, runner, retry);

        // Filter before inspecting so --target limits the external calls too
        if (!cli.target.empty()) {
            Target target = parse_target(cli.target);
            std::vector<ResourcePtr> kept;
            for (const auto& r : resources) {
                if (target.matches(r->kind(), r->id()))
                    kept.push_back(r);
            }
            LOG_DEBUG("Target '" + cli.target + "' keeps " + std::to_string(kept.size()) +
                      " of " + std::to_string(resources.size()) + " resources");
            resources = kept;
        }

        std::vector<DiffRecord> diffs = compute_diffs(resources, classifier);
        ExecutionPlan plan = build_plan(diffs, classifier);
        if (!cli.target.empty()) {
            plan = filter_plan(plan, parse_target(cli.target));
        }

        switch (command) {
        case Command::STATUS: {
            DiffSummary summary = summarize(diffs);
            if (cli.json) {
                std::cout << json::dump(status_to_json(summary), 2) << "\n";
            } else {
                print_status(summary);
            }
            return EXIT_OK;
        }
        case Command::DIFF: {
            if (cli.json) {
                std::cout << json::dump(diffs_to_json(diffs), 2) << "\n";
            } else {
                print_diff(diffs);
            }
            return EXIT_OK;
        }
        case Command::APPLY: {
            print_diff(diffs);
            if (plan.empty()) {
                return EXIT_OK;
            }

            ExecuteOptions options;
            options.dry_run = cli.dry_run;
            options.parallelism = config.settings.jobs;
            options.verbose = config.verbose;

            ConsoleProgress progress(config.verbose);
            TtyConfirm tty_confirm;
            AutoConfirm auto_confirm;
            Confirmer& confirm = cli.yes ? static_cast<Confirmer&>(auto_confirm)
                                         : static_cast<Confirmer&>(tty_confirm);

            Summary summary = execute_plan(plan, options, runner, progress, confirm);
            if (cli.dry_run) {
                std::cout << "\nDry run: no changes were made.\n";
                return EXIT_OK;
            }
            print_summary(summary);

            if (summary.privilege_denied) {
                return EXIT_PRIVILEGE_REFUSED;
            }
            return summary.success() ? EXIT_OK : EXIT_RESOURCE_FAILURE;
        }
        case Command::UNKNOWN:
            break;
        }
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        LOG_ERROR("Fatal Error: " + std::string(e.what()));
        return e.kind() == ErrorKind::InvalidConfig ? EXIT_CONFIG_ERROR : EXIT_RESOURCE_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        LOG_ERROR("Fatal Error: " + std::string(e.what()));
        return EXIT_RESOURCE_FAILURE;
    }
    return EXIT_OK;
}
