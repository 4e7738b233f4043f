#pragma once

#include "zmake/environment.hpp"
#include "zmake/events.hpp"
#include "zmake/result.hpp"
#include "zmake/task_model.hpp"

#include <set>
#include <string>
#include <vector>

namespace zmake {

// ============================================================================
// Step Dispatch
// ============================================================================

/**
 * Runs an ordered step list against a scope environment.
 *
 * `env` is the running environment of the scope: every step's delta is
 * merged into it. Failures are adjudicated with `policy`; the returned
 * error is one the scope could not absorb.
 */
class StepDispatcher {
public:
    virtual ~StepDispatcher() = default;

    virtual Result<void> dispatch_steps(const std::vector<std::string>& steps,
                                        Environment& env,
                                        ExecutionPolicy policy,
                                        const std::string& scope) = 0;
};

// ============================================================================
// Block Resolver
// ============================================================================

/**
 * Resolves block references over an immutable block table.
 *
 * A block runs on a clone of the caller's environment with its local
 * variables applied (VarSource::Local) and its own execution policy if it
 * declares one. The resolver hands back only the delta; the caller decides
 * when to merge it. Blocks currently executing are tracked so that a
 * re-entered block fails with BLOCK_CYCLE instead of recursing forever.
 */
class BlockResolver {
public:
    BlockResolver(const BlockTable& blocks, RunObserver& observer)
        : blocks_(blocks), observer_(observer) {}

    // Single unquoted whitespace-free token naming a block in the table
    bool is_block_reference(const std::string& step) const;

    const Block* find(const std::string& name) const;

    Result<Environment> resolve(const std::string& name,
                                const Environment& env,
                                ExecutionPolicy inherited,
                                const std::string& scope,
                                StepDispatcher& dispatcher);

    const std::vector<std::string>& entered() const { return entered_; }

private:
    const BlockTable& blocks_;
    RunObserver& observer_;
    std::set<std::string> in_flight_;
    std::vector<std::string> entered_;
};

// Trimmed step if it has the shape of a block reference, otherwise empty
std::string block_reference_token(const std::string& step);

} // namespace zmake
