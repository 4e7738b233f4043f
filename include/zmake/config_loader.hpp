#pragma once

#include "zmake/result.hpp"
#include "zmake/task_model.hpp"

#include <string>
#include <vector>

namespace zmake {

// ============================================================================
// Task File Loading
// ============================================================================

// Task file read when no path is given on the command line
constexpr const char* DEFAULT_TASK_FILE = "ZMake.yml";

struct TaskModelParseResult {
    bool ok = false;
    ErrorCode code = ErrorCode::PARSE_ERROR;  // PARSE_ERROR | CONSTRAINT_ERROR
    std::string error;
    TaskModel model;
    std::vector<std::string> warnings;
};

/**
 * Parses a YAML (or JSON) task document:
 *
 *     global_config: { execution_policy, env: {...}, skip_sections: [...] }
 *     tasks:  { <section>: { <os>: { steps: [...], config: {...} } | [...] } }
 *     blocks: { <name>: { steps: [...], config: {...} } | [...] }
 *
 * The result is validated (see validate_task_model) before it is returned.
 */
TaskModelParseResult parse_task_model(const std::string& text,
                                      const std::string& source_path = "");

// Reads and parses a task file; IO_ERROR if it cannot be read
Result<TaskModel> load_task_model(const std::string& path);

/**
 * Structural checks that must pass before anything runs:
 * - block names are single tokens and not a section or OS name
 * - no step is blank
 * - block references do not form a cycle
 * Violations are CONSTRAINT_ERROR.
 */
Result<void> validate_task_model(const TaskModel& model);

} // namespace zmake
