#pragma once

#include "zmake/types.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace zmake {

// ============================================================================
// Local Configuration (block or per-OS section override)
// ============================================================================

struct LocalConfig {
    std::optional<ExecutionPolicy> execution_policy;
    // Declaration order is kept so upserts happen as written
    std::vector<std::pair<std::string, std::string>> env;
};

// ============================================================================
// Step Lists
// ============================================================================

struct PlatformSteps {
    std::vector<std::string> steps;
    LocalConfig config;
};

struct SectionSpec {
    std::optional<PlatformSteps> on_windows;
    std::optional<PlatformSteps> on_linux;
    std::optional<PlatformSteps> on_macos;

    // Step list for the given OS, or nullptr
    const PlatformSteps* for_os(OsTarget os) const;
    PlatformSteps* for_os(OsTarget os);
};

struct Block {
    std::string name;
    std::vector<std::string> steps;
    LocalConfig config;
};

using BlockTable = std::map<std::string, Block>;

// ============================================================================
// Global Configuration
// ============================================================================

struct GlobalConfig {
    std::optional<ExecutionPolicy> execution_policy;
    std::vector<std::pair<std::string, std::string>> env;
    std::vector<Section> skip_sections;
};

// ============================================================================
// Task Model
// ============================================================================

/**
 * Validated in-memory form of a task file: the 8 fixed sections, the block
 * table and the global configuration. Immutable once loaded.
 */
struct TaskModel {
    std::array<std::optional<SectionSpec>, ALL_SECTIONS.size()> sections;
    BlockTable blocks;
    GlobalConfig global;

    // Source path for diagnostics
    std::string source_path;

    const std::optional<SectionSpec>& section(Section s) const {
        return sections[static_cast<size_t>(s)];
    }
    std::optional<SectionSpec>& section(Section s) {
        return sections[static_cast<size_t>(s)];
    }
};

// Reserved words a block name may not take (section and OS names)
bool is_reserved_block_name(const std::string& name);

} // namespace zmake
