#include "zmake/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace zmake {

Orchestrator::Orchestrator(const TaskModel& model, const RunConfig& config,
                           CommandExecutor& executor)
    : model_(model),
      config_(config),
      executor_(executor),
      observer_(default_observer_),
      resolver_(model.blocks, default_observer_) {}

Orchestrator::Orchestrator(const TaskModel& model, const RunConfig& config,
                           CommandExecutor& executor, RunObserver& observer)
    : model_(model),
      config_(config),
      executor_(executor),
      observer_(observer),
      resolver_(model.blocks, observer) {}

bool Orchestrator::should_run(Section section, std::string& reason) const {
    if (config_.sections) {
        const auto& allowed = *config_.sections;
        if (std::find(allowed.begin(), allowed.end(), section) == allowed.end()) {
            reason = "not requested";
            return false;
        }
        return true;
    }

    if (section == Section::Clean) {
        reason = "runs only when requested";
        return false;
    }

    const auto& skipped = model_.global.skip_sections;
    if (std::find(skipped.begin(), skipped.end(), section) != skipped.end()) {
        reason = "skipped by global_config";
        return false;
    }
    return true;
}

Result<void> Orchestrator::run(Environment& global_env) {
    summary_ = RunSummary{};
    ExecutionPolicy policy = root_policy();

    spdlog::debug("running {} for {} ({}{})", model_.source_path.empty() ? "tasks" : model_.source_path,
                  os_to_string(config_.os), policy_to_string(policy),
                  config_.dry_run ? ", dry run" : "");

    for (Section section : ALL_SECTIONS) {
        std::string reason;
        if (!should_run(section, reason)) {
            summary_.sections_skipped.push_back(section);
            observer_.on_section_skipped(section, reason);
            continue;
        }

        const auto& spec = model_.section(section);
        const PlatformSteps* steps = spec ? spec->for_os(config_.os) : nullptr;
        if (!steps || steps->steps.empty()) {
            spdlog::debug("no {} steps in {}", os_to_string(config_.os), section_to_string(section));
            continue;
        }

        auto ran = run_section(section, *steps, global_env, policy);
        if (ran.isErr()) {
            auto handled = adjudicate(ran.error(), policy, section_to_string(section));
            if (handled.isErr()) {
                summary_.blocks_entered = resolver_.entered();
                if (summary_.failures.empty()) {
                    return handled;
                }
                // Report what was carried before the run was aborted
                summary_.failures.push_back(handled.error().message());
                return Result<void>::err(Error(handled.error().code(),
                                               format_failures(summary_.failures)));
            }
        }
    }

    summary_.blocks_entered = resolver_.entered();

    if (!summary_.failures.empty()) {
        return Result<void>::err(Error(ErrorCode::COMMAND_FAILED,
                                       format_failures(summary_.failures)));
    }
    return Result<void>::ok();
}

Result<void> Orchestrator::run_section(Section section, const PlatformSteps& steps,
                                       Environment& global_env, ExecutionPolicy inherited) {
    Environment env = global_env;
    apply_variables(env, steps.config.env, VarSource::Local);
    ExecutionPolicy policy = steps.config.execution_policy.value_or(inherited);

    summary_.sections_run.push_back(section);
    observer_.on_section_started(section, policy);

    auto dispatched = dispatch_steps(steps.steps, env, policy, section_to_string(section));

    global_env.merge(env);

    if (dispatched.isErr()) {
        return dispatched;
    }
    observer_.on_section_finished(section);
    return Result<void>::ok();
}

Result<void> Orchestrator::dispatch_steps(const std::vector<std::string>& steps,
                                          Environment& env,
                                          ExecutionPolicy policy,
                                          const std::string& scope) {
    for (const auto& step : steps) {
        std::string token = block_reference_token(step);
        if (!token.empty() && resolver_.find(token)) {
            auto resolved = resolver_.resolve(token, env, policy, scope, *this);
            if (resolved.isErr()) {
                auto handled = adjudicate(resolved.error(), policy, scope);
                if (handled.isErr()) {
                    return handled;
                }
                continue;
            }
            env.merge(resolved.value());
            continue;
        }

        if (config_.dry_run) {
            ++summary_.commands_dry_run;
            observer_.on_dry_run_command(scope, step);
            continue;
        }

        observer_.on_command_started(scope, step);
        ++summary_.commands_run;

        auto executed = executor_.run(step, env);
        if (executed.isErr()) {
            // The shell itself could not be started: no policy applies
            Error error = executed.error();
            return Result<void>::err(error.withContext("[" + scope + "] '" + step + "'"));
        }

        const CommandResult& result = executed.value();
        env.merge(result.delta);
        observer_.on_command_finished(scope, step, result.exit_code);

        if (!result.success()) {
            Error failure(ErrorCode::COMMAND_FAILED,
                          "[" + scope + "] command failed: '" + step + "' (exit " +
                              std::to_string(result.exit_code) + ")");
            auto handled = adjudicate(failure, policy, scope);
            if (handled.isErr()) {
                return handled;
            }
        }
    }
    return Result<void>::ok();
}

Result<void> Orchestrator::adjudicate(const Error& error, ExecutionPolicy policy,
                                      const std::string& scope) {
    if (error.isFatal() || policy == ExecutionPolicy::FastFail) {
        return Result<void>::err(error);
    }
    summary_.failures.push_back(error.message());
    observer_.on_failure_carried(scope, error.message());
    return Result<void>::ok();
}

Environment compose_global_environment(const Environment& ambient,
                                       const TaskModel& model,
                                       const RunConfig& config) {
    Environment env = ambient;
    apply_variables(env, model.global.env, VarSource::Global);
    apply_variables(env, config.passed_env, VarSource::Passed);
    return env;
}

std::string format_failures(const std::vector<std::string>& failures) {
    std::string out = std::to_string(failures.size()) + " task(s) failed:";
    for (const auto& failure : failures) {
        out += "\n  - " + failure;
    }
    return out;
}

} // namespace zmake
