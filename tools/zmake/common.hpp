/**
 * zmake CLI - Common utilities and types
 */

#pragma once

#include <zmake/environment.hpp>
#include <zmake/events.hpp>
#include <zmake/types.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

#ifndef ZMAKE_VERSION
#define ZMAKE_VERSION "0.0.0"
#endif

namespace zmake::cli {

/**
 * Options parsed from the command line.
 */
struct GlobalOptions {
    std::string task_file;                 // positional FILE
    std::string cwd;                       // --cwd
    std::string os;                        // --os
    std::vector<std::string> sections;     // --section (repeatable)
    bool dry_run = false;                  // --dry-run
    std::vector<std::string> env;          // --env KEY=VALUE (repeatable)
    std::vector<std::string> env_files;    // --env-file
    std::string execution_policy;          // --execution-policy
    int verbose = 0;                       // -v, -vv
    bool quiet = false;                    // -q, --quiet
    bool json = false;                     // --json
    bool trace = false;                    // --trace
};

/**
 * Installs the default logger. In JSON mode stdout carries only the report,
 * so logs go to stderr.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = opts.json ? spdlog::stderr_color_mt("zmake") : spdlog::stdout_color_mt("zmake");
    logger->set_pattern("%^[%l]%$ %v");
    spdlog::set_default_logger(logger);

    if (opts.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else if (opts.verbose >= 2) {
        spdlog::set_level(spdlog::level::trace);
    } else if (opts.verbose == 1) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

// Variables that did not come from the ambient environment, with provenance
inline nlohmann::json environment_to_json(const Environment& env) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, var] : env.entries()) {
        if (var.source == VarSource::Default) continue;
        j[key] = {{"value", var.value}, {"source", source_to_string(var.source)}};
    }
    return j;
}

inline void print_environment_trace(const Environment& env) {
    std::cout << "Environment (non-default):" << std::endl;
    for (const auto& [key, var] : env.entries()) {
        if (var.source == VarSource::Default) continue;
        std::cout << "  " << key << "=" << var.value
                  << "  [" << source_to_string(var.source) << "]" << std::endl;
    }
}

/**
 * Renders run events through spdlog and remembers what happened to each
 * section for the JSON report.
 */
class LoggingObserver : public RunObserver {
public:
    struct SectionRecord {
        Section section;
        std::string status;  // "ran" | "failed" | "skipped"
        std::string reason;
    };

    void on_section_started(Section section, ExecutionPolicy policy) override {
        spdlog::info("==> {} ({})", section_to_string(section), policy_to_string(policy));
        records_.push_back({section, "failed", ""});
    }

    void on_section_finished(Section section) override {
        for (auto& record : records_) {
            if (record.section == section) record.status = "ran";
        }
    }

    void on_section_skipped(Section section, const std::string& reason) override {
        spdlog::debug("skipping {}: {}", section_to_string(section), reason);
        records_.push_back({section, "skipped", reason});
    }

    void on_block_entered(const std::string& scope, const std::string& block,
                          ExecutionPolicy policy) override {
        spdlog::debug("[{}] entering block '{}' ({})", scope, block, policy_to_string(policy));
    }

    void on_block_left(const std::string& scope, const std::string& block) override {
        spdlog::trace("[{}] leaving block '{}'", scope, block);
    }

    void on_command_started(const std::string& scope, const std::string& command) override {
        spdlog::info("[{}] $ {}", scope, command);
    }

    void on_command_finished(const std::string& scope, const std::string& command,
                             int exit_code) override {
        if (exit_code != 0) {
            spdlog::error("[{}] '{}' exited with {}", scope, command, exit_code);
        } else {
            spdlog::debug("[{}] '{}' ok", scope, command);
        }
    }

    void on_dry_run_command(const std::string& scope, const std::string& command) override {
        spdlog::info("[{}] (dry run) {}", scope, command);
    }

    void on_failure_carried(const std::string& scope, const std::string& message) override {
        spdlog::warn("[{}] continuing after failure: {}", scope, message);
    }

    const std::vector<SectionRecord>& records() const { return records_; }

    nlohmann::json sections_to_json() const {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& record : records_) {
            nlohmann::json entry;
            entry["name"] = section_to_string(record.section);
            entry["status"] = record.status;
            if (!record.reason.empty()) {
                entry["reason"] = record.reason;
            }
            j.push_back(entry);
        }
        return j;
    }

private:
    std::vector<SectionRecord> records_;
};

} // namespace zmake::cli
