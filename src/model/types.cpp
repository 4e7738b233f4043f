#include "zmake/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace zmake {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string normalize_key(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (c == '_' || c == '-') continue;
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

} // namespace

std::optional<Section> parse_section(const std::string& name) {
    std::string key = normalize_key(name);
    for (Section s : ALL_SECTIONS) {
        if (key == section_key(s)) return s;
    }
    return std::nullopt;
}

std::string describe_lifecycle() {
    std::string out;
    for (Section s : ALL_SECTIONS) {
        if (s == Section::Clean) continue;
        if (!out.empty()) out += ", ";
        out += section_to_string(s);
    }
    out += " and, on request, ";
    out += section_to_string(Section::Clean);
    return out;
}

std::optional<OsTarget> parse_os_target(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "windows") return OsTarget::Windows;
    if (lower == "linux") return OsTarget::Linux;
    if (lower == "macos") return OsTarget::MacOS;
    return std::nullopt;
}

std::optional<ExecutionPolicy> parse_execution_policy(const std::string& s) {
    std::string key = normalize_key(s);
    if (key == "fastfail") return ExecutionPolicy::FastFail;
    if (key == "carryforward") return ExecutionPolicy::CarryForward;
    return std::nullopt;
}

std::optional<VarSource> parse_var_source(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "default") return VarSource::Default;
    if (lower == "global") return VarSource::Global;
    if (lower == "local") return VarSource::Local;
    if (lower == "passed") return VarSource::Passed;
    if (lower == "script") return VarSource::Script;
    return std::nullopt;
}

} // namespace zmake
