#pragma once

#include "zmake/block_resolver.hpp"
#include "zmake/environment.hpp"
#include "zmake/events.hpp"
#include "zmake/executor.hpp"
#include "zmake/result.hpp"
#include "zmake/run_config.hpp"
#include "zmake/task_model.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace zmake {

// ============================================================================
// Run Summary
// ============================================================================

struct RunSummary {
    std::vector<Section> sections_run;
    std::vector<Section> sections_skipped;
    size_t commands_run = 0;
    size_t commands_dry_run = 0;
    std::vector<std::string> blocks_entered;
    // Failures absorbed by carry_forward scopes, in order of occurrence
    std::vector<std::string> failures;
};

// ============================================================================
// Orchestrator
// ============================================================================

/**
 * Walks the lifecycle sections in their fixed order and dispatches steps.
 *
 * Each section runs on a clone of the global environment with its per-OS
 * local variables applied; the section environment is merged back into the
 * global one when the section ends. A failure is handled by the policy of
 * the scope it happens in: fast_fail hands it to the enclosing scope,
 * carry_forward records it and moves on. Failures that reach the run
 * itself are judged by the root policy. If anything was recorded the run
 * ends with one COMMAND_FAILED error listing every failure.
 */
class Orchestrator : public StepDispatcher {
public:
    Orchestrator(const TaskModel& model, const RunConfig& config, CommandExecutor& executor);
    Orchestrator(const TaskModel& model, const RunConfig& config, CommandExecutor& executor,
                 RunObserver& observer);

    Result<void> run(Environment& global_env);

    Result<void> dispatch_steps(const std::vector<std::string>& steps,
                                Environment& env,
                                ExecutionPolicy policy,
                                const std::string& scope) override;

    // Whether a section passes the allow-list / default-skip filters
    bool should_run(Section section, std::string& reason) const;

    ExecutionPolicy root_policy() const { return effective_policy(config_, model_.global); }

    const RunSummary& summary() const { return summary_; }

private:
    Result<void> run_section(Section section, const PlatformSteps& steps,
                             Environment& global_env, ExecutionPolicy inherited);

    // Records the failure under carry_forward; otherwise hands it back
    Result<void> adjudicate(const Error& error, ExecutionPolicy policy, const std::string& scope);

    const TaskModel& model_;
    const RunConfig& config_;
    CommandExecutor& executor_;
    RunObserver default_observer_;
    RunObserver& observer_;
    BlockResolver resolver_;
    RunSummary summary_;
};

/**
 * Builds the environment a run starts from: the ambient variables, then
 * global_config.env (Global), then --env / --env-file values (Passed).
 */
Environment compose_global_environment(const Environment& ambient,
                                       const TaskModel& model,
                                       const RunConfig& config);

// "2 task(s) failed:\n  - ...\n  - ..."
std::string format_failures(const std::vector<std::string>& failures);

} // namespace zmake
