#include <doctest/doctest.h>
#include <zmake/result.hpp>
#include <zmake/task_model.hpp>
#include <zmake/types.hpp>

using namespace zmake;

TEST_CASE("parse_section accepts case and separator variants") {
    CHECK(parse_section("PreBuild") == Section::PreBuild);
    CHECK(parse_section("prebuild") == Section::PreBuild);
    CHECK(parse_section("pre_build") == Section::PreBuild);
    CHECK(parse_section("pre-build") == Section::PreBuild);
    CHECK(parse_section("POST_DEPLOY") == Section::PostDeploy);
    CHECK(parse_section("clean") == Section::Clean);
    CHECK_FALSE(parse_section("compile").has_value());
    CHECK_FALSE(parse_section("").has_value());
}

TEST_CASE("section order is fixed") {
    REQUIRE(ALL_SECTIONS.size() == 8);
    CHECK(ALL_SECTIONS.front() == Section::PreBuild);
    CHECK(ALL_SECTIONS[1] == Section::Build);
    CHECK(ALL_SECTIONS.back() == Section::Clean);
}

TEST_CASE("lifecycle description follows the execution order") {
    CHECK(describe_lifecycle() ==
          "PreBuild, Build, PostBuild, Test, PreDeploy, Deploy, PostDeploy and, on request, Clean");
}

TEST_CASE("parse_os_target is case-insensitive") {
    CHECK(parse_os_target("Windows") == OsTarget::Windows);
    CHECK(parse_os_target("LINUX") == OsTarget::Linux);
    CHECK(parse_os_target("macos") == OsTarget::MacOS);
    CHECK_FALSE(parse_os_target("freebsd").has_value());
}

TEST_CASE("parse_execution_policy accepts snake and camel case") {
    CHECK(parse_execution_policy("fast_fail") == ExecutionPolicy::FastFail);
    CHECK(parse_execution_policy("FastFail") == ExecutionPolicy::FastFail);
    CHECK(parse_execution_policy("carry_forward") == ExecutionPolicy::CarryForward);
    CHECK(parse_execution_policy("carry-forward") == ExecutionPolicy::CarryForward);
    CHECK_FALSE(parse_execution_policy("retry").has_value());
}

TEST_CASE("var sources round trip through their names") {
    for (VarSource s : {VarSource::Default, VarSource::Global, VarSource::Local,
                        VarSource::Passed, VarSource::Script}) {
        CHECK(parse_var_source(source_to_string(s)) == s);
    }
    CHECK(source_priority(VarSource::Default) < source_priority(VarSource::Global));
    CHECK(source_priority(VarSource::Passed) < source_priority(VarSource::Script));
}

TEST_CASE("reserved block names") {
    CHECK(is_reserved_block_name("build"));
    CHECK(is_reserved_block_name("Pre_Build"));
    CHECK(is_reserved_block_name("windows"));
    CHECK(is_reserved_block_name("MacOS"));
    CHECK_FALSE(is_reserved_block_name("setup_tools"));
}

TEST_CASE("fatal error codes") {
    CHECK(Error(ErrorCode::SPAWN_FAILED, "x").isFatal());
    CHECK(Error(ErrorCode::BLOCK_CYCLE, "x").isFatal());
    CHECK_FALSE(Error(ErrorCode::COMMAND_FAILED, "x").isFatal());
    CHECK_FALSE(Error(ErrorCode::BLOCK_NOT_FOUND, "x").isFatal());
}

TEST_CASE("Error context and string form") {
    Error error(ErrorCode::COMMAND_FAILED, "exit 2");
    error.withContext("[Build]");
    CHECK(error.message() == "[Build]: exit 2");
    CHECK(error.toString() == "command_failed: [Build]: exit 2");
}
