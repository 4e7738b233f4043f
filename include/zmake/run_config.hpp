#pragma once

#include "zmake/result.hpp"
#include "zmake/task_model.hpp"
#include "zmake/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace zmake {

// ============================================================================
// Run Configuration
// ============================================================================

/**
 * Everything a run needs besides the task model. Produced by the command
 * line front end and only read by the orchestrator.
 */
struct RunConfig {
    OsTarget os = OsTarget::Linux;
    std::string cwd;
    bool dry_run = false;

    // Explicit section allow-list; when set, Clean runs only if listed
    std::optional<std::vector<Section>> sections;

    // Overrides global_config.execution_policy
    std::optional<ExecutionPolicy> execution_policy;

    // --env-file entries followed by --env pairs, tagged VarSource::Passed
    std::vector<std::pair<std::string, std::string>> passed_env;
};

// CLI override, else global config, else FastFail
ExecutionPolicy effective_policy(const RunConfig& config, const GlobalConfig& global);

// ============================================================================
// KEY=VALUE Parsing
// ============================================================================

struct KeyValueParseResult {
    bool ok = false;
    std::string error;
    std::string key;
    std::string value;
};

// Splits at the first '='; the key must not be empty
KeyValueParseResult parse_key_value(const std::string& s);

struct EnvFileParseResult {
    std::vector<std::pair<std::string, std::string>> entries;
    std::vector<std::string> warnings;
};

// One KEY=VALUE per line; blank lines and '#' comments are ignored,
// malformed lines are skipped with a warning
EnvFileParseResult parse_env_file(const std::string& content,
                                  const std::string& source_path = "");

// Reads and parses an env file; IO_ERROR if it cannot be read
Result<std::vector<std::pair<std::string, std::string>>> load_env_file(const std::string& path);

} // namespace zmake
