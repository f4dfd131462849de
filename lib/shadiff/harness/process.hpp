#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace shadiff::harness {
    struct command_t {
        std::string exe {};
        std::vector<std::string> args {};
        std::string work_dir {};
        std::optional<std::chrono::milliseconds> timeout {};
    };

    struct process_result_t {
        int exit_code = 0;
        bool timed_out = false;
        // the standard output followed by the standard error
        std::string output {};
    };

    struct process_runner_t {
        virtual ~process_runner_t() =default;
        // blocks until the process exits or its timeout expires
        virtual process_result_t run(const command_t &cmd) =0;
    };

    /*
     * Runs commands as child processes, each in its own process group. A process that outlives
     * its timeout is killed with all its descendants before run returns; the group handle
     * terminates them on any other early exit.
     */
    struct system_process_runner_t final: process_runner_t {
        process_result_t run(const command_t &cmd) override;
    };

    // names without a slash are looked up in PATH
    extern std::optional<std::string> find_executable(const std::string &name);
}
