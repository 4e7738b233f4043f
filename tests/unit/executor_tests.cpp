#include <doctest/doctest.h>
#include <zmake/executor.hpp>

#include <string>

using namespace zmake;

// =============================================================================
// Shell Scripts
// =============================================================================

TEST_CASE("posix script dumps NUL-separated and keeps the command status") {
    std::string script = build_shell_script(OsTarget::Linux, "make all", "/tmp/dump");
    CHECK(script.find("make all\n") == 0);
    CHECK(script.find("__zmake_status=$?\n") != std::string::npos);
    CHECK(script.find("env -0 > '/tmp/dump'") != std::string::npos);
    CHECK(script.find("exit $__zmake_status") != std::string::npos);
}

TEST_CASE("posix dump path is single-quoted") {
    std::string script = build_shell_script(OsTarget::MacOS, "true", "/tmp/it's");
    CHECK(script.find("'/tmp/it'\\''s'") != std::string::npos);
}

TEST_CASE("windows script passes the command text through unaltered") {
    const std::string command = "echo Build done! & echo !PATH! %CD%";
    std::string script = build_shell_script(OsTarget::Windows, command, "C:\\tmp\\dump");

    CHECK(script.compare(0, command.size(), command) == 0);
    CHECK(script.substr(command.size()).find(" & call set \"ZMAKE_EXIT_STATUS=%^ERRORLEVEL%\"") == 0);
    CHECK(script.find("set > \"C:\\tmp\\dump\"") != std::string::npos);
    CHECK(script.find("call exit /b %^ZMAKE_EXIT_STATUS%") != std::string::npos);
    CHECK(script.find("!ERRORLEVEL!") == std::string::npos);
}

TEST_CASE("cmd.exe runs without delayed expansion") {
    std::string line = windows_command_line("echo hi!");
    CHECK(line == "cmd.exe /S /C \"echo hi!\"");
    CHECK(line.find("/V:ON") == std::string::npos);
}

TEST_CASE("dump separators") {
    CHECK(dump_separator(OsTarget::Linux) == '\0');
    CHECK(dump_separator(OsTarget::MacOS) == '\0');
    CHECK(dump_separator(OsTarget::Windows) == '\n');
}

TEST_CASE("shell-maintained variables are volatile") {
    CHECK(is_volatile_variable("_"));
    CHECK(is_volatile_variable("SHLVL"));
    CHECK(is_volatile_variable("PWD"));
    CHECK(is_volatile_variable("OLDPWD"));
    CHECK(is_volatile_variable("ZMAKE_EXIT_STATUS"));
    CHECK_FALSE(is_volatile_variable("PATH"));
}
