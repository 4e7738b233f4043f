#include <doctest/doctest.h>
#include <zmake/environment.hpp>

using namespace zmake;

// =============================================================================
// Source Priority
// =============================================================================

TEST_CASE("upsert inserts absent keys with any source") {
    Environment env;
    CHECK(env.upsert("PATH", "/usr/bin", VarSource::Default));
    REQUIRE(env.find("PATH") != nullptr);
    CHECK(env.find("PATH")->value == "/usr/bin");
    CHECK(env.find("PATH")->source == VarSource::Default);
}

TEST_CASE("lower priority source never overwrites a higher one") {
    Environment env;
    env.upsert("CC", "clang", VarSource::Passed);

    CHECK_FALSE(env.upsert("CC", "gcc", VarSource::Global));
    CHECK_FALSE(env.upsert("CC", "gcc", VarSource::Local));
    CHECK(env.get("CC") == "clang");
    CHECK(env.find("CC")->source == VarSource::Passed);

    CHECK(env.upsert("CC", "tcc", VarSource::Script));
    CHECK(env.get("CC") == "tcc");
    CHECK(env.find("CC")->source == VarSource::Script);
}

TEST_CASE("equal priority source overwrites the value") {
    Environment env;
    env.upsert("MODE", "debug", VarSource::Local);
    CHECK(env.upsert("MODE", "release", VarSource::Local));
    CHECK(env.get("MODE") == "release");
}

TEST_CASE("rewriting the same value and source reports no change") {
    Environment env;
    env.upsert("MODE", "debug", VarSource::Global);
    CHECK_FALSE(env.upsert("MODE", "debug", VarSource::Global));
    CHECK(env.upsert("MODE", "debug", VarSource::Local));
}

TEST_CASE("every source pair respects the priority order") {
    const VarSource sources[] = {VarSource::Default, VarSource::Global, VarSource::Local,
                                 VarSource::Passed, VarSource::Script};
    for (VarSource first : sources) {
        for (VarSource second : sources) {
            Environment env;
            env.upsert("K", "first", first);
            env.upsert("K", "second", second);

            VarSource expected = source_priority(second) >= source_priority(first) ? second : first;
            CAPTURE(source_to_string(first));
            CAPTURE(source_to_string(second));
            CHECK(env.find("K")->source == expected);
        }
    }
}

// =============================================================================
// Merge
// =============================================================================

TEST_CASE("merge keeps the stronger source") {
    Environment parent;
    parent.upsert("A", "parent", VarSource::Passed);
    parent.upsert("B", "parent", VarSource::Default);

    Environment child;
    child.upsert("A", "child", VarSource::Local);
    child.upsert("B", "child", VarSource::Script);
    child.upsert("C", "child", VarSource::Local);

    parent.merge(child);
    CHECK(parent.get("A") == "parent");
    CHECK(parent.get("B") == "child");
    CHECK(parent.get("C") == "child");
}

TEST_CASE("merge is idempotent") {
    Environment base;
    base.upsert("A", "1", VarSource::Default);
    base.upsert("B", "2", VarSource::Passed);

    Environment other;
    other.upsert("A", "3", VarSource::Script);
    other.upsert("D", "4", VarSource::Local);

    Environment once = base;
    once.merge(other);
    Environment twice = once;
    twice.merge(other);

    CHECK(once == twice);
}

// =============================================================================
// Load / Dump
// =============================================================================

TEST_CASE("dump and load round trip preserves values") {
    Environment env;
    env.upsert("HOME", "/home/dev", VarSource::Default);
    env.upsert("EMPTY", "", VarSource::Global);
    env.upsert("URL", "http://host/?a=b", VarSource::Passed);

    Environment loaded;
    loaded.load(env.dump(), VarSource::Script);

    CHECK(loaded.size() == env.size());
    for (const auto& [key, var] : env.entries()) {
        CHECK(loaded.get(key) == var.value);
        CHECK(loaded.find(key)->source == VarSource::Script);
    }
}

TEST_CASE("NUL-separated dump keeps multi-line values intact") {
    Environment env;
    env.upsert("CERT", "line1\nline2=tail", VarSource::Script);
    env.upsert("JSON", "{\n  \"a\": 1\n}\r", VarSource::Script);
    env.upsert("PLAIN", "x", VarSource::Script);

    Environment loaded;
    loaded.load(env.dump('\0'), VarSource::Script, '\0');

    CHECK(loaded == env);
    CHECK_FALSE(loaded.contains("line2"));
}

TEST_CASE("load skips malformed lines") {
    Environment env;
    env.load("GOOD=1\nno equals sign\n=C:=C:\\work\r\nALSO_GOOD=a=b\r\n\n", VarSource::Script);

    CHECK(env.size() == 2);
    CHECK(env.get("GOOD") == "1");
    CHECK(env.get("ALSO_GOOD") == "a=b");
}

TEST_CASE("load splits at the first equals sign") {
    Environment env;
    env.load("OPTS=-DX=1 -DY=2", VarSource::Script);
    CHECK(env.get("OPTS") == "-DX=1 -DY=2");
}

// =============================================================================
// Diff
// =============================================================================

TEST_CASE("diff returns new and changed entries only") {
    Environment base;
    base.upsert("SAME", "1", VarSource::Global);
    base.upsert("CHANGED", "old", VarSource::Global);
    base.upsert("RETAGGED", "v", VarSource::Default);

    Environment local = base;
    local.upsert("CHANGED", "new", VarSource::Local);
    local.upsert("RETAGGED", "v", VarSource::Local);
    local.upsert("ADDED", "x", VarSource::Script);

    Environment delta = local.diff(base);
    CHECK(delta.size() == 3);
    CHECK_FALSE(delta.contains("SAME"));
    CHECK(delta.get("CHANGED") == "new");
    CHECK(delta.find("RETAGGED")->source == VarSource::Local);
    CHECK(delta.get("ADDED") == "x");
}

TEST_CASE("apply_variables writes pairs in order") {
    Environment env;
    apply_variables(env, {{"A", "1"}, {"A", "2"}, {"B", "3"}}, VarSource::Global);
    CHECK(env.get("A") == "2");
    CHECK(env.get("B") == "3");
    CHECK(env.find("A")->source == VarSource::Global);
}

TEST_CASE("to_strings renders KEY=VALUE") {
    Environment env;
    env.upsert("B", "2", VarSource::Default);
    env.upsert("A", "1", VarSource::Default);
    auto strings = env.to_strings();
    REQUIRE(strings.size() == 2);
    CHECK(strings[0] == "A=1");
    CHECK(strings[1] == "B=2");
}
