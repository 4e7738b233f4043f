/**
 * zmake CLI - Entry Point
 *
 * Runs the lifecycle sections of a task file for one operating system.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#include <zmake/config_loader.hpp>
#include <zmake/executor.hpp>
#include <zmake/orchestrator.hpp>
#include <zmake/platform.hpp>
#include <zmake/run_config.hpp>

namespace zmake::cli {

namespace {

// Turns the parsed options into a RunConfig; false after printing an error
bool build_run_config(const GlobalOptions& opts, RunConfig& config) {
    auto host = detect_host_os();

    if (!opts.os.empty()) {
        auto os = parse_os_target(opts.os);
        if (!os) {
            print_error("unknown operating system '" + opts.os +
                            "' (expected windows, linux or macos)",
                        opts.json);
            return false;
        }
        config.os = *os;
    } else if (host) {
        config.os = *host;
    } else {
        print_error("cannot detect the host operating system; pass --os", opts.json);
        return false;
    }

    config.dry_run = opts.dry_run;
    if (!host || *host != config.os) {
        spdlog::warn("target {} is not the host operating system; running as a dry run",
                     os_to_string(config.os));
        config.dry_run = true;
    }

    config.cwd = opts.cwd.empty() ? current_directory() : opts.cwd;
    if (!path_exists(config.cwd)) {
        print_error("working directory does not exist: " + config.cwd, opts.json);
        return false;
    }

    if (!opts.sections.empty()) {
        std::vector<Section> sections;
        for (const auto& name : opts.sections) {
            auto section = parse_section(name);
            if (!section) {
                print_error("unknown section '" + name + "'", opts.json);
                return false;
            }
            sections.push_back(*section);
        }
        config.sections = std::move(sections);
    }

    if (!opts.execution_policy.empty()) {
        auto policy = parse_execution_policy(opts.execution_policy);
        if (!policy) {
            print_error("invalid execution policy '" + opts.execution_policy +
                            "' (expected fast_fail or carry_forward)",
                        opts.json);
            return false;
        }
        config.execution_policy = *policy;
    }

    // Files first so that --env on the command line wins
    for (const auto& path : opts.env_files) {
        auto entries = load_env_file(path);
        if (entries.isErr()) {
            print_error(entries.error().message(), opts.json);
            return false;
        }
        for (auto& entry : entries.value()) {
            config.passed_env.push_back(std::move(entry));
        }
    }

    for (const auto& pair : opts.env) {
        auto kv = parse_key_value(pair);
        if (!kv.ok) {
            print_error("invalid --env '" + pair + "': " + kv.error, opts.json);
            return false;
        }
        config.passed_env.emplace_back(kv.key, kv.value);
    }

    return true;
}

Environment ambient_environment(const RunConfig& config) {
    // Capture through a shell that can actually run here
    OsTarget shell_os = detect_host_os().value_or(config.os);
    auto captured = capture_ambient(shell_os, config.cwd);
    if (captured.isOk()) {
        return std::move(captured.value());
    }

    spdlog::warn("could not capture the shell environment ({}); using the process environment",
                 captured.error().message());
    Environment env;
    for (const auto& [key, value] : get_all_env()) {
        env.upsert(key, value, VarSource::Default);
    }
    return env;
}

} // namespace

int cmd_run(const GlobalOptions& opts) {
    RunConfig config;
    if (!build_run_config(opts, config)) {
        return 1;
    }

    auto loaded = load_task_model(opts.task_file);
    if (loaded.isErr()) {
        print_error(loaded.error().toString(), opts.json);
        return 1;
    }
    const TaskModel& model = loaded.value();

    Environment env = compose_global_environment(ambient_environment(config), model, config);

    ShellExecutor executor(config.os, config.cwd);
    LoggingObserver observer;
    Orchestrator orchestrator(model, config, executor, observer);

    auto result = orchestrator.run(env);
    const RunSummary& summary = orchestrator.summary();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.isOk();
        if (result.isErr()) {
            j["error"] = result.error().toString();
        }
        j["os"] = os_to_string(config.os);
        j["dry_run"] = config.dry_run;
        j["execution_policy"] = policy_to_string(orchestrator.root_policy());
        j["failures"] = summary.failures;
        j["sections"] = observer.sections_to_json();
        j["commands_run"] = summary.commands_run;
        j["commands_dry_run"] = summary.commands_dry_run;
        j["blocks_entered"] = summary.blocks_entered;
        if (opts.trace) {
            j["environment"] = environment_to_json(env);
        }
        output_json(j);
        return result.isOk() ? 0 : 1;
    }

    if (opts.trace) {
        print_environment_trace(env);
    }

    if (result.isErr()) {
        print_error(result.error().message(), false);
        return 1;
    }

    if (config.dry_run) {
        spdlog::info("dry run complete: {} command(s) in {} section(s)",
                     summary.commands_dry_run, summary.sections_run.size());
    } else {
        spdlog::info("done: {} command(s) in {} section(s)",
                     summary.commands_run, summary.sections_run.size());
    }
    return 0;
}

} // namespace zmake::cli

int main(int argc, char** argv) {
    using namespace zmake::cli;

    std::string description = std::string("zmake - declarative lifecycle task runner v") +
                              ZMAKE_VERSION + "\n\nRuns the sections of a task file in order:\n" +
                              zmake::describe_lifecycle() + ".";
    CLI::App app{description};
    app.set_version_flag("-V,--version", ZMAKE_VERSION);

    GlobalOptions opts;
    opts.task_file = zmake::DEFAULT_TASK_FILE;

    app.add_option("file", opts.task_file, "Task file (YAML or JSON)")
        ->capture_default_str();
    app.add_option("--cwd", opts.cwd, "Working directory for every command");
    app.add_option("--os", opts.os,
        "Target operating system: windows, linux or macos (default: host)");
    app.add_option("-s,--section", opts.sections,
        "Run only these sections (repeatable, comma separated)")->delimiter(',');
    app.add_flag("-n,--dry-run", opts.dry_run,
        "Print the commands instead of running them");
    app.add_option("-e,--env", opts.env,
        "Pass a variable to every command as KEY=VALUE (repeatable)");
    app.add_option("--env-file", opts.env_files,
        "Read KEY=VALUE lines from a file (repeatable)");
    app.add_option("--execution-policy", opts.execution_policy,
        "Override the global policy: fast_fail or carry_forward");
    app.add_flag("--json", opts.json,
        "Print a JSON report on stdout");
    app.add_flag("--trace", opts.trace,
        "Show the final environment with the source of each variable");
    app.add_flag("-v,--verbose", opts.verbose,
        "Show detailed progress (-vv for shell level detail)");
    app.add_flag("-q,--quiet", opts.quiet,
        "Only show warnings and errors");

    CLI11_PARSE(app, argc, argv);

    init_logging(opts);
    return cmd_run(opts);
}
