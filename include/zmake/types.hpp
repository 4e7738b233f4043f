#pragma once

#include <array>
#include <optional>
#include <string>

namespace zmake {

// ============================================================================
// Lifecycle Sections
// ============================================================================

enum class Section {
    PreBuild,
    Build,
    PostBuild,
    Test,
    PreDeploy,
    Deploy,
    PostDeploy,
    Clean,
};

// Fixed execution order
constexpr std::array<Section, 8> ALL_SECTIONS = {
    Section::PreBuild,
    Section::Build,
    Section::PostBuild,
    Section::Test,
    Section::PreDeploy,
    Section::Deploy,
    Section::PostDeploy,
    Section::Clean,
};

inline const char* section_to_string(Section s) {
    switch (s) {
        case Section::PreBuild: return "PreBuild";
        case Section::Build: return "Build";
        case Section::PostBuild: return "PostBuild";
        case Section::Test: return "Test";
        case Section::PreDeploy: return "PreDeploy";
        case Section::Deploy: return "Deploy";
        case Section::PostDeploy: return "PostDeploy";
        case Section::Clean: return "Clean";
        default: return "Unknown";
    }
}

// Key used in task files ("prebuild", "build", ...)
inline const char* section_key(Section s) {
    switch (s) {
        case Section::PreBuild: return "prebuild";
        case Section::Build: return "build";
        case Section::PostBuild: return "postbuild";
        case Section::Test: return "test";
        case Section::PreDeploy: return "predeploy";
        case Section::Deploy: return "deploy";
        case Section::PostDeploy: return "postdeploy";
        case Section::Clean: return "clean";
        default: return "unknown";
    }
}

// Case-insensitive; '_' and '-' are ignored ("PreBuild", "pre_build", "pre-build")
std::optional<Section> parse_section(const std::string& name);

// "PreBuild, Build, ... and, on request, Clean" in execution order
std::string describe_lifecycle();

// ============================================================================
// Target Operating System
// ============================================================================

enum class OsTarget {
    Windows,
    Linux,
    MacOS,
};

constexpr std::array<OsTarget, 3> ALL_OS_TARGETS = {
    OsTarget::Windows,
    OsTarget::Linux,
    OsTarget::MacOS,
};

inline const char* os_to_string(OsTarget os) {
    switch (os) {
        case OsTarget::Windows: return "windows";
        case OsTarget::Linux: return "linux";
        case OsTarget::MacOS: return "macos";
        default: return "linux";
    }
}

std::optional<OsTarget> parse_os_target(const std::string& s);

// ============================================================================
// Execution Policy
// ============================================================================

enum class ExecutionPolicy {
    FastFail,      // first failing step aborts the enclosing scope
    CarryForward,  // failures are recorded and execution continues
};

inline const char* policy_to_string(ExecutionPolicy p) {
    switch (p) {
        case ExecutionPolicy::FastFail: return "fast_fail";
        case ExecutionPolicy::CarryForward: return "carry_forward";
        default: return "fast_fail";
    }
}

std::optional<ExecutionPolicy> parse_execution_policy(const std::string& s);

// ============================================================================
// Variable Source (provenance, ordered by priority)
// ============================================================================

enum class VarSource {
    Default = 1,  // captured ambient OS environment
    Global = 2,   // global_config.env
    Local = 3,    // block or per-OS section config
    Passed = 4,   // --env / --env-file
    Script = 5,   // captured after a shell command
};

inline int source_priority(VarSource s) {
    return static_cast<int>(s);
}

inline const char* source_to_string(VarSource s) {
    switch (s) {
        case VarSource::Default: return "default";
        case VarSource::Global: return "global";
        case VarSource::Local: return "local";
        case VarSource::Passed: return "passed";
        case VarSource::Script: return "script";
        default: return "default";
    }
}

std::optional<VarSource> parse_var_source(const std::string& s);

} // namespace zmake
