#pragma once

#include "zmake/types.hpp"

#include <string>

namespace zmake {

/**
 * Receives the semantic events of a run. Rendering them (terminal, JSON,
 * nothing at all) is up to the implementation; every method defaults to a
 * no-op.
 *
 * `scope` names where a step runs: "Build" for a section, "Build > setup"
 * for a block entered from that section.
 */
class RunObserver {
public:
    virtual ~RunObserver() = default;

    virtual void on_section_started(Section /*section*/, ExecutionPolicy /*policy*/) {}
    virtual void on_section_finished(Section /*section*/) {}
    virtual void on_section_skipped(Section /*section*/, const std::string& /*reason*/) {}

    virtual void on_block_entered(const std::string& /*scope*/, const std::string& /*block*/,
                                  ExecutionPolicy /*policy*/) {}
    virtual void on_block_left(const std::string& /*scope*/, const std::string& /*block*/) {}

    virtual void on_command_started(const std::string& /*scope*/, const std::string& /*command*/) {}
    virtual void on_command_finished(const std::string& /*scope*/, const std::string& /*command*/,
                                     int /*exit_code*/) {}
    virtual void on_dry_run_command(const std::string& /*scope*/, const std::string& /*command*/) {}

    // A failure absorbed by a carry_forward scope
    virtual void on_failure_carried(const std::string& /*scope*/, const std::string& /*message*/) {}
};

} // namespace zmake
