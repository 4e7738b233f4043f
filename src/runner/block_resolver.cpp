#include "zmake/block_resolver.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace zmake {

std::string block_reference_token(const std::string& step) {
    size_t start = 0;
    while (start < step.size() && std::isspace(static_cast<unsigned char>(step[start]))) ++start;
    size_t end = step.size();
    while (end > start && std::isspace(static_cast<unsigned char>(step[end - 1]))) --end;

    std::string token = step.substr(start, end - start);
    if (token.empty()) {
        return "";
    }
    for (char c : token) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            return "";
        }
    }
    char first = token.front();
    if (first == '"' || first == '\'') {
        return "";
    }
    return token;
}

bool BlockResolver::is_block_reference(const std::string& step) const {
    std::string token = block_reference_token(step);
    return !token.empty() && blocks_.count(token) > 0;
}

const Block* BlockResolver::find(const std::string& name) const {
    auto it = blocks_.find(name);
    return it == blocks_.end() ? nullptr : &it->second;
}

Result<Environment> BlockResolver::resolve(const std::string& name,
                                           const Environment& env,
                                           ExecutionPolicy inherited,
                                           const std::string& scope,
                                           StepDispatcher& dispatcher) {
    const Block* block = find(name);
    if (!block) {
        return Result<Environment>::err(
            Error(ErrorCode::BLOCK_NOT_FOUND, "block not found: '" + name + "'"));
    }

    if (in_flight_.count(name) > 0) {
        return Result<Environment>::err(Error(
            ErrorCode::BLOCK_CYCLE, "block '" + name + "' references itself through " + scope));
    }

    Environment local = env;
    apply_variables(local, block->config.env, VarSource::Local);
    ExecutionPolicy policy = block->config.execution_policy.value_or(inherited);

    std::string block_scope = scope + " > " + name;
    observer_.on_block_entered(scope, name, policy);
    entered_.push_back(name);
    in_flight_.insert(name);

    auto dispatched = dispatcher.dispatch_steps(block->steps, local, policy, block_scope);

    in_flight_.erase(name);
    observer_.on_block_left(scope, name);

    if (dispatched.isErr()) {
        const Error& error = dispatched.error();
        if (policy == ExecutionPolicy::CarryForward && !error.isFatal()) {
            // Failures were recorded where they happened
            spdlog::debug("block '{}' finished with carried failures", name);
        } else {
            return Result<Environment>::err(error);
        }
    }

    return Result<Environment>::ok(local.diff(env));
}

} // namespace zmake
