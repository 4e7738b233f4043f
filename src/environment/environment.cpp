#include "zmake/environment.hpp"

#include <sstream>

namespace zmake {

bool Environment::upsert(const std::string& key, const std::string& value, VarSource source) {
    auto it = vars_.find(key);
    if (it == vars_.end()) {
        vars_.emplace(key, EnvVariable{value, source});
        return true;
    }

    EnvVariable& current = it->second;
    if (source_priority(source) < source_priority(current.source)) {
        return false;
    }
    if (current.source == source && current.value == value) {
        return false;
    }

    current.value = value;
    current.source = source;
    return true;
}

void Environment::merge(const Environment& other) {
    for (const auto& [key, var] : other.vars_) {
        upsert(key, var.value, var.source);
    }
}

void Environment::load(const std::string& dump, VarSource source, char separator) {
    std::istringstream stream(dump);
    std::string line;
    while (std::getline(stream, line, separator)) {
        if (separator == '\n' && !line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        auto eq = line.find('=');
        // Skips malformed lines and cmd.exe's hidden "=C:=C:\..." entries
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        upsert(line.substr(0, eq), line.substr(eq + 1), source);
    }
}

std::string Environment::dump(char separator) const {
    std::string out;
    for (const auto& [key, var] : vars_) {
        out += key;
        out += '=';
        out += var.value;
        out += separator;
    }
    return out;
}

Environment Environment::diff(const Environment& base) const {
    Environment delta;
    for (const auto& [key, var] : vars_) {
        const EnvVariable* old = base.find(key);
        if (!old || *old != var) {
            delta.vars_.emplace(key, var);
        }
    }
    return delta;
}

std::optional<std::string> Environment::get(const std::string& key) const {
    auto it = vars_.find(key);
    if (it == vars_.end()) return std::nullopt;
    return it->second.value;
}

const EnvVariable* Environment::find(const std::string& key) const {
    auto it = vars_.find(key);
    return it == vars_.end() ? nullptr : &it->second;
}

std::vector<std::string> Environment::to_strings() const {
    std::vector<std::string> result;
    result.reserve(vars_.size());
    for (const auto& [key, var] : vars_) {
        result.push_back(key + "=" + var.value);
    }
    return result;
}

void apply_variables(Environment& env,
                     const std::vector<std::pair<std::string, std::string>>& vars,
                     VarSource source) {
    for (const auto& [key, value] : vars) {
        env.upsert(key, value, source);
    }
}

} // namespace zmake
