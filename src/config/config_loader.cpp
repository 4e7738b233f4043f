#include "zmake/config_loader.hpp"
#include "zmake/block_resolver.hpp"
#include "zmake/platform.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <stdexcept>

namespace zmake {

namespace {

// Thrown inside the loader only; turned into a TaskModelParseResult
class LoadError : public std::runtime_error {
public:
    LoadError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

[[noreturn]] void constraint(const std::string& message) {
    throw LoadError(ErrorCode::CONSTRAINT_ERROR, message);
}

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string scalar_string(const YAML::Node& node, const std::string& where) {
    if (node.IsNull()) {
        return "";
    }
    if (!node.IsScalar()) {
        constraint(where + " must be a string");
    }
    return node.as<std::string>();
}

std::vector<std::string> parse_steps(const YAML::Node& node, const std::string& where) {
    std::vector<std::string> steps;
    if (node.IsNull()) {
        return steps;
    }
    if (!node.IsSequence()) {
        constraint("steps of " + where + " must be a list");
    }
    size_t index = 0;
    for (const auto& item : node) {
        ++index;
        if (item.IsNull()) {
            constraint("Empty step found in " + where);
        }
        if (!item.IsScalar()) {
            constraint("step " + std::to_string(index) + " of " + where + " must be a string");
        }
        steps.push_back(item.as<std::string>());
    }
    return steps;
}

std::vector<std::pair<std::string, std::string>> parse_env_map(const YAML::Node& node,
                                                               const std::string& where) {
    std::vector<std::pair<std::string, std::string>> env;
    if (node.IsNull()) {
        return env;
    }
    if (!node.IsMap()) {
        constraint("env of " + where + " must be a mapping");
    }
    for (const auto& kv : node) {
        std::string key = scalar_string(kv.first, "env key in " + where);
        if (key.empty()) {
            constraint("empty env key in " + where);
        }
        env.emplace_back(key, scalar_string(kv.second, "env value '" + key + "' in " + where));
    }
    return env;
}

ExecutionPolicy parse_policy(const YAML::Node& node, const std::string& where) {
    std::string value = scalar_string(node, "execution_policy of " + where);
    auto policy = parse_execution_policy(value);
    if (!policy) {
        constraint("invalid execution_policy '" + value + "' in " + where +
                   " (expected fast_fail or carry_forward)");
    }
    return *policy;
}

LocalConfig parse_local_config(const YAML::Node& node, const std::string& where) {
    LocalConfig config;
    if (node.IsNull()) {
        return config;
    }
    if (!node.IsMap()) {
        constraint("config of " + where + " must be a mapping");
    }
    for (const auto& kv : node) {
        std::string key = scalar_string(kv.first, "config key in " + where);
        if (key == "execution_policy") {
            config.execution_policy = parse_policy(kv.second, where);
        } else if (key == "env") {
            config.env = parse_env_map(kv.second, where);
        } else {
            constraint("unknown config key '" + key + "' in " + where);
        }
    }
    return config;
}

// Either a bare list of steps or { steps: [...], config: {...} }
void parse_step_holder(const YAML::Node& node, const std::string& where,
                       std::vector<std::string>& steps, LocalConfig& config) {
    if (node.IsNull()) {
        return;
    }
    if (node.IsSequence()) {
        steps = parse_steps(node, where);
        return;
    }
    if (!node.IsMap()) {
        constraint(where + " must be a list of steps or a mapping with 'steps'");
    }
    for (const auto& kv : node) {
        std::string key = scalar_string(kv.first, "key in " + where);
        if (key == "steps") {
            steps = parse_steps(kv.second, where);
        } else if (key == "config") {
            config = parse_local_config(kv.second, where);
        } else {
            constraint("unknown key '" + key + "' in " + where);
        }
    }
}

SectionSpec parse_section_spec(const YAML::Node& node, Section section) {
    SectionSpec spec;
    std::string name = section_to_string(section);
    if (node.IsNull()) {
        return spec;
    }
    if (!node.IsMap()) {
        constraint("section " + name + " must map operating systems to steps");
    }
    for (const auto& kv : node) {
        std::string os_key = scalar_string(kv.first, "key in section " + name);
        auto os = parse_os_target(os_key);
        if (!os) {
            constraint("unknown operating system '" + os_key + "' in section " + name);
        }
        if (spec.for_os(*os)) {
            constraint("operating system '" + std::string(os_to_string(*os)) +
                       "' listed twice in section " + name);
        }
        PlatformSteps steps;
        parse_step_holder(kv.second, "section " + name + " (" + os_to_string(*os) + ")",
                          steps.steps, steps.config);
        switch (*os) {
            case OsTarget::Windows: spec.on_windows = std::move(steps); break;
            case OsTarget::Linux: spec.on_linux = std::move(steps); break;
            case OsTarget::MacOS: spec.on_macos = std::move(steps); break;
        }
    }
    return spec;
}

void parse_tasks(const YAML::Node& node, TaskModel& model) {
    if (node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        constraint("tasks must be a mapping of sections");
    }
    for (const auto& kv : node) {
        std::string key = scalar_string(kv.first, "section name");
        auto section = parse_section(key);
        if (!section) {
            constraint("unknown section '" + key + "'");
        }
        if (model.section(*section)) {
            constraint("section " + std::string(section_to_string(*section)) +
                       " listed twice (as '" + key + "')");
        }
        model.section(*section) = parse_section_spec(kv.second, *section);
    }
}

void parse_blocks(const YAML::Node& node, TaskModel& model) {
    if (node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        constraint("blocks must be a mapping of block names");
    }
    for (const auto& kv : node) {
        Block block;
        block.name = scalar_string(kv.first, "block name");
        if (model.blocks.count(block.name)) {
            constraint("block '" + block.name + "' defined twice");
        }
        parse_step_holder(kv.second, "block '" + block.name + "'", block.steps, block.config);
        model.blocks[block.name] = std::move(block);
    }
}

void parse_global(const YAML::Node& node, TaskModel& model,
                  std::vector<std::string>& warnings) {
    if (node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        constraint("global_config must be a mapping");
    }
    for (const auto& kv : node) {
        std::string key = scalar_string(kv.first, "global_config key");
        if (key == "execution_policy") {
            model.global.execution_policy = parse_policy(kv.second, "global_config");
        } else if (key == "env") {
            model.global.env = parse_env_map(kv.second, "global_config");
        } else if (key == "skip_sections" || key == "banned_sections") {
            if (key == "banned_sections") {
                warnings.push_back("global_config.banned_sections is read as skip_sections");
            }
            for (const auto& name : parse_steps(kv.second, "global_config." + key)) {
                auto section = parse_section(name);
                if (!section) {
                    constraint("unknown section '" + name + "' in global_config." + key);
                }
                model.global.skip_sections.push_back(*section);
            }
        } else {
            constraint("unknown global_config key '" + key + "'");
        }
    }
}

bool is_single_token(const std::string& name) {
    return !name.empty() && block_reference_token(name) == name;
}

// Depth-first search over block references; returns the cycle path if any
std::vector<std::string> find_block_cycle(const BlockTable& blocks) {
    enum class Mark { Unvisited, Active, Done };
    std::map<std::string, Mark> marks;
    std::vector<std::string> stack;
    std::vector<std::string> cycle;

    std::function<bool(const std::string&)> visit = [&](const std::string& name) {
        marks[name] = Mark::Active;
        stack.push_back(name);
        for (const auto& step : blocks.at(name).steps) {
            std::string ref = block_reference_token(step);
            if (ref.empty() || blocks.count(ref) == 0) continue;

            Mark mark = marks.count(ref) ? marks[ref] : Mark::Unvisited;
            if (mark == Mark::Active) {
                auto start = std::find(stack.begin(), stack.end(), ref);
                cycle.assign(start, stack.end());
                cycle.push_back(ref);
                return true;
            }
            if (mark == Mark::Unvisited && visit(ref)) {
                return true;
            }
        }
        stack.pop_back();
        marks[name] = Mark::Done;
        return false;
    };

    for (const auto& [name, block] : blocks) {
        if (marks.count(name) == 0 && visit(name)) {
            return cycle;
        }
    }
    return {};
}

} // namespace

Result<void> validate_task_model(const TaskModel& model) {
    auto fail = [](const std::string& message) {
        return Result<void>::err(Error(ErrorCode::CONSTRAINT_ERROR, message));
    };

    for (const auto& [name, block] : model.blocks) {
        if (is_reserved_block_name(name)) {
            std::string kind = parse_section(name) ? "section" : "operating system";
            return fail("Block name '" + name + "' conflicts with reserved " + kind + " name");
        }
        if (!is_single_token(name)) {
            return fail("Block name '" + name + "' must be a single unquoted token");
        }
        for (const auto& step : block.steps) {
            if (is_blank(step)) {
                return fail("Empty step found in block '" + name + "'");
            }
        }
    }

    for (Section section : ALL_SECTIONS) {
        const auto& spec = model.section(section);
        if (!spec) continue;
        for (OsTarget os : ALL_OS_TARGETS) {
            const PlatformSteps* steps = spec->for_os(os);
            if (!steps) continue;
            for (const auto& step : steps->steps) {
                if (is_blank(step)) {
                    return fail(std::string("Empty step found in section ") +
                                section_to_string(section) + " (" + os_to_string(os) + ")");
                }
            }
        }
    }

    auto cycle = find_block_cycle(model.blocks);
    if (!cycle.empty()) {
        std::string path;
        for (const auto& name : cycle) {
            if (!path.empty()) path += " -> ";
            path += name;
        }
        return fail("Block reference cycle: " + path);
    }

    return Result<void>::ok();
}

TaskModelParseResult parse_task_model(const std::string& text, const std::string& source_path) {
    TaskModelParseResult result;
    result.model.source_path = source_path;

    try {
        YAML::Node root = YAML::Load(text);

        if (!root.IsNull()) {
            if (!root.IsMap()) {
                throw LoadError(ErrorCode::PARSE_ERROR, "task file must be a mapping");
            }
            for (const auto& kv : root) {
                std::string key = scalar_string(kv.first, "top-level key");
                if (key == "tasks") {
                    parse_tasks(kv.second, result.model);
                } else if (key == "blocks") {
                    parse_blocks(kv.second, result.model);
                } else if (key == "global_config") {
                    parse_global(kv.second, result.model, result.warnings);
                } else {
                    constraint("unknown top-level key '" + key + "'");
                }
            }
        }
    } catch (const LoadError& e) {
        result.code = e.code();
        result.error = e.what();
        return result;
    } catch (const YAML::Exception& e) {
        result.code = ErrorCode::PARSE_ERROR;
        result.error = std::string("failed to parse YAML config: ") + e.what();
        return result;
    }

    auto valid = validate_task_model(result.model);
    if (valid.isErr()) {
        result.code = valid.error().code();
        result.error = valid.error().message();
        return result;
    }

    result.ok = true;
    return result;
}

Result<TaskModel> load_task_model(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return Result<TaskModel>::err(Error(ErrorCode::IO_ERROR, "cannot read task file: " + path));
    }

    auto parsed = parse_task_model(*content, path);
    if (!parsed.ok) {
        return Result<TaskModel>::err(Error(parsed.code, path + ": " + parsed.error));
    }
    for (const auto& warning : parsed.warnings) {
        spdlog::warn("{}: {}", path, warning);
    }
    return Result<TaskModel>::ok(std::move(parsed.model));
}

} // namespace zmake
