#pragma once

#include "zmake/environment.hpp"
#include "zmake/result.hpp"
#include "zmake/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace zmake {

// ============================================================================
// Command Result
// ============================================================================

struct CommandResult {
    int exit_code = -1;
    // Variables the command set or changed, tagged VarSource::Script
    Environment delta;

    bool success() const { return exit_code == 0; }
};

// ============================================================================
// Command Executor Interface
// ============================================================================

/**
 * Runs a single command line against an environment snapshot.
 *
 * A returned error means the command could not be started at all
 * (ErrorCode::SPAWN_FAILED). A command that ran and failed is reported
 * through CommandResult::exit_code, together with whatever environment
 * changes it managed to make.
 */
class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    virtual Result<CommandResult> run(const std::string& command_line,
                                      const Environment& env) = 0;
};

// ============================================================================
// Shell Executor
// ============================================================================

/**
 * Executes command lines under the target OS shell.
 *
 * - windows: cmd /S /C "<command> & set > <dump>"
 * - linux, macos: /bin/sh -c "<command>; env -0 > <dump>"
 *
 * The dump is written to a uniquely named transient file after the command
 * completes (preserving its exit status), read back, reduced to the
 * variables that changed and removed. stdout and stderr are inherited,
 * stdin is the null device.
 */
class ShellExecutor : public CommandExecutor {
public:
    ShellExecutor(OsTarget os, std::string cwd)
        : os_(os), cwd_(std::move(cwd)) {}

    Result<CommandResult> run(const std::string& command_line,
                              const Environment& env) override;

    OsTarget os() const { return os_; }
    const std::string& cwd() const { return cwd_; }

private:
    OsTarget os_;
    std::string cwd_;
};

// Shell script that runs command_line and then dumps the environment
std::string build_shell_script(OsTarget os, const std::string& command_line,
                               const std::string& dump_path);

// Record separator of the environment dump: NUL for env -0, newline for cmd's set
char dump_separator(OsTarget os);

// Command line handed to CreateProcess for a cmd.exe script
std::string windows_command_line(const std::string& script);

// Variables maintained by the shell itself; never part of a delta
bool is_volatile_variable(const std::string& key);

/**
 * Captures the ambient environment by asking the native shell to print it.
 * The result is tagged VarSource::Default. Fails if the shell cannot be
 * spawned or exits non-zero.
 */
Result<Environment> capture_ambient(OsTarget os, const std::string& cwd);

} // namespace zmake
