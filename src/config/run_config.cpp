#include "zmake/run_config.hpp"
#include "zmake/platform.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>

namespace zmake {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

ExecutionPolicy effective_policy(const RunConfig& config, const GlobalConfig& global) {
    if (config.execution_policy) {
        return *config.execution_policy;
    }
    return global.execution_policy.value_or(ExecutionPolicy::FastFail);
}

KeyValueParseResult parse_key_value(const std::string& s) {
    KeyValueParseResult result;

    auto eq = s.find('=');
    if (eq == std::string::npos) {
        result.error = "expected KEY=VALUE";
        return result;
    }
    if (eq == 0) {
        result.error = "key cannot be empty";
        return result;
    }

    result.key = s.substr(0, eq);
    result.value = s.substr(eq + 1);
    result.ok = true;
    return result;
}

EnvFileParseResult parse_env_file(const std::string& content, const std::string& source_path) {
    EnvFileParseResult result;

    std::istringstream stream(content);
    std::string line;
    size_t line_no = 0;
    while (std::getline(stream, line)) {
        ++line_no;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        auto kv = parse_key_value(trimmed);
        if (!kv.ok) {
            result.warnings.push_back(source_path + ":" + std::to_string(line_no) + ": " +
                                      kv.error);
            continue;
        }
        result.entries.emplace_back(kv.key, kv.value);
    }

    return result;
}

Result<std::vector<std::pair<std::string, std::string>>> load_env_file(const std::string& path) {
    using EntriesResult = Result<std::vector<std::pair<std::string, std::string>>>;

    auto content = read_file(path);
    if (!content) {
        return EntriesResult::err(Error(ErrorCode::IO_ERROR, "cannot read env file: " + path));
    }

    auto parsed = parse_env_file(*content, path);
    for (const auto& warning : parsed.warnings) {
        spdlog::warn("ignoring env file line {}", warning);
    }
    return EntriesResult::ok(std::move(parsed.entries));
}

} // namespace zmake
