#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <array>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>
#include <shadiff/common/format.hpp>
#include "process.hpp"
#include "result-parser.hpp"

namespace shadiff::harness {
    enum class variant_t {
        baseline,
        optimized
    };
    static constexpr std::array<variant_t, 2> all_variants { variant_t::baseline, variant_t::optimized };

    struct variant_info_t {
        std::string_view name;
        std::string_view package;
        std::string_view design;
        std::string_view testbench;
        std::string_view entity;
    };

    extern const variant_info_t &variant_info(variant_t variant);

    enum class run_state_t {
        idle,
        compiling,
        elaborating,
        running,
        completed,
        compile_failed,
        elaborate_failed,
        timeout
    };

    struct run_result_t {
        run_state_t state = run_state_t::idle;
        // filled only in the completed state
        parse_result_t report {};
        // captured output of the failed phase
        std::string error_text {};

        [[nodiscard]] bool pipeline_failed() const noexcept
        {
            return state != run_state_t::completed;
        }
    };

    struct simulator_config_t {
        std::string work_dir = ".";
        std::string tool = "nvc";
        std::chrono::milliseconds run_timeout { 30'000 };
    };

    /*
     * Drives one variant through the compile, elaborate and run phases of the simulator.
     * The phases are strictly sequential and a failed phase ends the run for that variant.
     */
    struct simulator_t {
        explicit simulator_t(process_runner_t &runner, simulator_config_t cfg={});

        run_result_t run(variant_t variant) const;
        // paths of the VHDL sources of all variants missing from the working directory
        std::vector<std::string> missing_artifacts() const;

        const simulator_config_t &config() const noexcept
        {
            return _cfg;
        }
    private:
        process_runner_t &_runner;
        simulator_config_t _cfg;
    };
}

namespace fmt {
    template<>
    struct formatter<shadiff::harness::variant_t>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const shadiff::harness::variant_t &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(shadiff::harness::variant_info(v).name, ctx);
        }
    };

    template<>
    struct formatter<shadiff::harness::run_state_t>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const shadiff::harness::run_state_t &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using shadiff::harness::run_state_t;
            std::string_view name = "unknown";
            switch (v) {
                case run_state_t::idle: name = "idle"; break;
                case run_state_t::compiling: name = "compiling"; break;
                case run_state_t::elaborating: name = "elaborating"; break;
                case run_state_t::running: name = "running"; break;
                case run_state_t::completed: name = "completed"; break;
                case run_state_t::compile_failed: name = "compile failed"; break;
                case run_state_t::elaborate_failed: name = "elaborate failed"; break;
                case run_state_t::timeout: name = "timeout"; break;
            }
            return formatter<std::string_view>::format(name, ctx);
        }
    };
}
