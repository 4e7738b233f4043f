#include "zmake/executor.hpp"
#include "zmake/platform.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif
#endif

namespace zmake {

namespace {

// Holds the user command's exit status across the dump on cmd.exe
constexpr const char* EXIT_STATUS_MARKER = "ZMAKE_EXIT_STATUS";

constexpr const char* POSIX_SHELL = "/bin/sh";

std::string quote_posix(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string quote_cmd(const std::string& s) {
    return "\"" + s + "\"";
}

#ifndef _WIN32

// Written by the child to the error pipe when it cannot exec the shell
struct SpawnFailure {
    int stage = 0;  // 0 = stdin, 1 = chdir, 2 = exec
    int error = 0;
};

const char* spawn_stage_to_string(int stage) {
    switch (stage) {
        case 0: return "cannot open null device for stdin";
        case 1: return "cannot enter working directory";
        default: return "cannot execute shell";
    }
}

/**
 * fork/execve with a close-on-exec error pipe, so a failed exec is reported
 * as SPAWN_FAILED instead of looking like a command that exited with 127.
 * A null env_strings inherits the runner's own environment.
 */
Result<int> spawn_posix(const std::vector<std::string>& argv_strings,
                        const std::string& cwd,
                        const std::vector<std::string>* env_strings) {
    std::vector<char*> argv;
    for (const auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    char** envp_ptr = environ;
    if (env_strings) {
        for (const auto& s : *env_strings) {
            envp.push_back(const_cast<char*>(s.c_str()));
        }
        envp.push_back(nullptr);
        envp_ptr = envp.data();
    }

    int err_pipe[2];
    if (pipe(err_pipe) != 0) {
        return Result<int>::err(Error(ErrorCode::SPAWN_FAILED,
                                      "pipe failed: " + std::string(strerror(errno))));
    }
    fcntl(err_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();

    if (pid == -1) {
        int saved = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        return Result<int>::err(Error(ErrorCode::SPAWN_FAILED,
                                      "fork failed: " + std::string(strerror(saved))));
    }

    if (pid == 0) {
        // Child process
        close(err_pipe[0]);

        auto fail = [&](int stage) {
            SpawnFailure failure;
            failure.stage = stage;
            failure.error = errno;
            ssize_t n = write(err_pipe[1], &failure, sizeof(failure));
            (void)n;
            _exit(127);
        };

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0) {
            fail(0);
        }
        if (devnull > STDIN_FILENO) {
            close(devnull);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            fail(1);
        }

        execve(argv[0], argv.data(), envp_ptr);
        fail(2);
    }

    // Parent process
    close(err_pipe[1]);

    SpawnFailure failure;
    ssize_t n;
    do {
        n = read(err_pipe[0], &failure, sizeof(failure));
    } while (n == -1 && errno == EINTR);
    close(err_pipe[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (waited == -1) {
        return Result<int>::err(Error(ErrorCode::SPAWN_FAILED,
                                      "waitpid failed: " + std::string(strerror(errno))));
    }

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        std::string where = failure.stage == 1 ? " '" + cwd + "'" : " " + argv_strings[0];
        return Result<int>::err(Error(ErrorCode::SPAWN_FAILED,
                                      std::string(spawn_stage_to_string(failure.stage)) + where +
                                          ": " + strerror(failure.error)));
    }

    if (WIFEXITED(status)) {
        return Result<int>::ok(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return Result<int>::ok(128 + WTERMSIG(status));
    }
    return Result<int>::err(Error(ErrorCode::SPAWN_FAILED, "process terminated abnormally"));
}

#else

std::string build_environment_block(const std::vector<std::string>& env) {
    std::string block;
    for (const auto& e : env) {
        block += e;
        block += '\0';
    }
    block += '\0';
    return block;
}

Result<int> spawn_windows(const std::string& command_line,
                          const std::string& cwd,
                          const std::vector<std::string>* env_strings) {
    SECURITY_ATTRIBUTES sa = {0};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE null_in = CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE,
                                 &sa, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);

    STARTUPINFOA si = {0};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = null_in;
    si.hStdOutput = GetStdHandle(STD_OUTPUT_HANDLE);
    si.hStdError = GetStdHandle(STD_ERROR_HANDLE);

    PROCESS_INFORMATION pi = {0};

    std::string env_block;
    if (env_strings) {
        env_block = build_environment_block(*env_strings);
    }
    std::string cmd_line = command_line;

    BOOL success = CreateProcessA(
        nullptr,
        const_cast<char*>(cmd_line.c_str()),
        nullptr,  // Process security attributes
        nullptr,  // Thread security attributes
        TRUE,     // Inherit handles
        0,        // Creation flags
        env_strings ? const_cast<char*>(env_block.c_str()) : nullptr,
        cwd.empty() ? nullptr : cwd.c_str(),
        &si,
        &pi);

    if (null_in != INVALID_HANDLE_VALUE) {
        CloseHandle(null_in);
    }

    if (!success) {
        return Result<int>::err(Error(ErrorCode::SPAWN_FAILED,
                                      "CreateProcess failed: " + std::to_string(GetLastError())));
    }

    WaitForSingleObject(pi.hProcess, INFINITE);

    DWORD exit_code = 0;
    BOOL got_code = GetExitCodeProcess(pi.hProcess, &exit_code);

    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);

    if (!got_code) {
        return Result<int>::err(Error(ErrorCode::SPAWN_FAILED, "GetExitCodeProcess failed"));
    }
    return Result<int>::ok(static_cast<int>(exit_code));
}

#endif

// Runs script under the shell of the target OS
Result<int> spawn_shell(OsTarget os, const std::string& script, const std::string& cwd,
                        const std::vector<std::string>* env_strings) {
#ifdef _WIN32
    if (os == OsTarget::Windows) {
        return spawn_windows(windows_command_line(script), cwd, env_strings);
    }
    std::string escaped;
    for (char c : script) {
        if (c == '"') escaped += '\\';
        escaped += c;
    }
    return spawn_windows("sh -c \"" + escaped + "\"", cwd, env_strings);
#else
    if (os == OsTarget::Windows) {
        return Result<int>::err(Error(ErrorCode::SPAWN_FAILED,
                                      "cmd.exe is not available on this host"));
    }
    return spawn_posix({POSIX_SHELL, "-c", script}, cwd, env_strings);
#endif
}

} // namespace

std::string build_shell_script(OsTarget os, const std::string& command_line,
                               const std::string& dump_path) {
    if (os == OsTarget::Windows) {
        // "call" re-expands %^NAME% after the command ran; the command text
        // itself only sees cmd's ordinary parse-time expansion
        std::string marker = EXIT_STATUS_MARKER;
        return command_line + " & call set \"" + marker + "=%^ERRORLEVEL%\" & set > " +
               quote_cmd(dump_path) + " & call exit /b %^" + marker + "%";
    }
    return command_line + "\n" +
           "__zmake_status=$?\n" +
           "env -0 > " + quote_posix(dump_path) + "\n" +
           "exit $__zmake_status\n";
}

char dump_separator(OsTarget os) {
    return os == OsTarget::Windows ? '\n' : '\0';
}

std::string windows_command_line(const std::string& script) {
    return "cmd.exe /S /C \"" + script + "\"";
}

bool is_volatile_variable(const std::string& key) {
    return key == "_" || key == "SHLVL" || key == "PWD" || key == "OLDPWD" ||
           key == EXIT_STATUS_MARKER;
}

Result<CommandResult> ShellExecutor::run(const std::string& command_line,
                                         const Environment& env) {
    TransientFile dump(make_transient_path("zmake-env"));
    std::string script = build_shell_script(os_, command_line, dump.path());
    spdlog::trace("shell script:\n{}", script);

    auto env_strings = env.to_strings();
    auto spawned = spawn_shell(os_, script, cwd_, &env_strings);
    if (spawned.isErr()) {
        return Result<CommandResult>::err(spawned.error());
    }

    CommandResult result;
    result.exit_code = spawned.value();

    auto content = read_file(dump.path());
    if (!content) {
        // The command left the shell early (e.g. "exit 3"); nothing to fold back
        spdlog::debug("no environment dump after '{}'", command_line);
        return Result<CommandResult>::ok(std::move(result));
    }

    char separator = dump_separator(os_);
    Environment after;
    after.load(*content, VarSource::Script, separator);
    for (const auto& [key, var] : after.entries()) {
        if (is_volatile_variable(key)) {
            continue;
        }
        auto before = env.get(key);
        if (before && *before == var.value) {
            continue;
        }
        // A line-based dump cannot carry multi-line values back intact
        if (separator == '\n' && before && before->find('\n') != std::string::npos) {
            continue;
        }
        spdlog::trace("captured {}={}", key, var.value);
        result.delta.upsert(key, var.value, VarSource::Script);
    }

    return Result<CommandResult>::ok(std::move(result));
}

Result<Environment> capture_ambient(OsTarget os, const std::string& cwd) {
    TransientFile dump(make_transient_path("zmake-ambient"));
    std::string script = os == OsTarget::Windows
                             ? "set > " + quote_cmd(dump.path())
                             : "env -0 > " + quote_posix(dump.path());

    auto spawned = spawn_shell(os, script, cwd, nullptr);
    if (spawned.isErr()) {
        Error error = spawned.error();
        return Result<Environment>::err(error.withContext("failed to capture ambient environment"));
    }
    if (spawned.value() != 0) {
        return Result<Environment>::err(Error(
            ErrorCode::COMMAND_FAILED,
            "failed to initialize environment variables (exit " +
                std::to_string(spawned.value()) + ")"));
    }

    auto content = read_file(dump.path());
    if (!content) {
        return Result<Environment>::err(Error(ErrorCode::IO_ERROR,
                                              "environment dump not written: " + dump.path()));
    }

    Environment env;
    env.load(*content, VarSource::Default, dump_separator(os));
    spdlog::debug("captured {} ambient variables", env.size());
    return Result<Environment>::ok(std::move(env));
}

} // namespace zmake
