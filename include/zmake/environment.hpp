#pragma once

#include "zmake/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace zmake {

// ============================================================================
// Environment Variable
// ============================================================================

struct EnvVariable {
    std::string value;
    VarSource source = VarSource::Default;

    bool operator==(const EnvVariable& other) const {
        return value == other.value && source == other.source;
    }
    bool operator!=(const EnvVariable& other) const { return !(*this == other); }
};

// ============================================================================
// Environment Store
// ============================================================================

/**
 * Provenance-tagged variable table.
 *
 * Every key holds the value written by the highest-priority source that has
 * set it (Default < Global < Local < Passed < Script). The table can only be
 * changed through upsert(), merge() and load(), all of which enforce that
 * ordering. Scopes work on copies and hand their changes back as a delta
 * (see diff()) that the parent merges.
 */
class Environment {
public:
    using Table = std::map<std::string, EnvVariable>;

    Environment() = default;

    // Writes if the key is absent or source priority >= stored priority.
    // Returns false when the write was rejected or changed nothing.
    bool upsert(const std::string& key, const std::string& value, VarSource source);

    // Upserts every entry of other with its stored value and source
    void merge(const Environment& other);

    // Parses KEY=VALUE records and upserts each pair with the given source.
    // Records without '=' or with an empty key are skipped. With '\n' a
    // trailing '\r' is dropped; use '\0' for values that contain newlines.
    void load(const std::string& dump, VarSource source, char separator = '\n');

    // KEY=VALUE records in key order, each terminated by separator
    std::string dump(char separator = '\n') const;

    // Entries absent from base or differing from it in value or source
    Environment diff(const Environment& base) const;

    std::optional<std::string> get(const std::string& key) const;
    const EnvVariable* find(const std::string& key) const;
    bool contains(const std::string& key) const { return vars_.count(key) > 0; }

    size_t size() const { return vars_.size(); }
    bool empty() const { return vars_.empty(); }
    const Table& entries() const { return vars_; }

    // "KEY=VALUE" strings for a child process environment block
    std::vector<std::string> to_strings() const;

    bool operator==(const Environment& other) const { return vars_ == other.vars_; }
    bool operator!=(const Environment& other) const { return !(*this == other); }

private:
    Table vars_;
};

// Upserts a list of key/value pairs with one source
void apply_variables(Environment& env,
                     const std::vector<std::pair<std::string, std::string>>& vars,
                     VarSource source);

} // namespace zmake
