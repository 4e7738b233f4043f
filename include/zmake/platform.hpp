#pragma once

#include "zmake/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace zmake {

// ============================================================================
// Platform Detection
// ============================================================================

// OS this binary was built for, or nullopt on an unsupported platform
std::optional<OsTarget> detect_host_os();

// ============================================================================
// File Helpers
// ============================================================================

std::optional<std::string> read_file(const std::string& path);

bool path_exists(const std::string& path);

// Returns true if the file was removed
bool remove_file(const std::string& path);

std::string current_directory();

// Unique path in the system temp directory: <tmp>/<prefix>.<pid>.<hex>
std::string make_transient_path(const std::string& prefix);

/**
 * Owns a transient file path and removes the file when it goes out of scope.
 * Used for the environment dumps written by child shells.
 */
class TransientFile {
public:
    explicit TransientFile(std::string path) : path_(std::move(path)) {}
    ~TransientFile() { remove_file(path_); }

    TransientFile(const TransientFile&) = delete;
    TransientFile& operator=(const TransientFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// ============================================================================
// Environment
// ============================================================================

// Environment of the running process
std::unordered_map<std::string, std::string> get_all_env();

} // namespace zmake
