/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <filesystem>
#include <shadiff/common/error.hpp>
#include <shadiff/common/logger.hpp>
#include <shadiff/common/timer.hpp>
#include "simulator.hpp"

namespace shadiff::harness {
    const variant_info_t &variant_info(const variant_t variant)
    {
        static constexpr variant_info_t baseline {
            "baseline", "sha384_pkg.vhd", "sha384.vhd", "sha384_file_tb.vhd", "sha384_file_tb"
        };
        static constexpr variant_info_t optimized {
            "optimized", "sha384_fast_pkg.vhd", "sha384_fast.vhd", "sha384_fast_file_tb.vhd", "sha384_fast_file_tb"
        };
        switch (variant) {
            case variant_t::baseline: return baseline;
            case variant_t::optimized: return optimized;
            default: throw error(fmt::format("unsupported variant: {}", static_cast<int>(variant)));
        }
    }

    simulator_t::simulator_t(process_runner_t &runner, simulator_config_t cfg):
        _runner { runner },
        _cfg { std::move(cfg) }
    {
    }

    run_result_t simulator_t::run(const variant_t variant) const
    {
        const auto &info = variant_info(variant);
        run_result_t res {};
        const auto phase = [&](const run_state_t state, std::vector<std::string> args, std::optional<std::chrono::milliseconds> timeout={}) {
            res.state = state;
            logger::debug("{}: {}", variant, state);
            const timer t { fmt::format("{} {}", variant, state) };
            return _runner.run(command_t { _cfg.tool, std::move(args), _cfg.work_dir, timeout });
        };

        if (const auto comp = phase(run_state_t::compiling,
                { "-a", std::string { info.package }, std::string { info.design }, std::string { info.testbench } });
                comp.exit_code != 0) {
            res.state = run_state_t::compile_failed;
            res.error_text = comp.output;
            return res;
        }
        if (const auto elab = phase(run_state_t::elaborating, { "-e", std::string { info.entity } }); elab.exit_code != 0) {
            res.state = run_state_t::elaborate_failed;
            res.error_text = elab.output;
            return res;
        }
        const auto sim = phase(run_state_t::running, { "-r", std::string { info.entity } }, _cfg.run_timeout);
        if (sim.timed_out) {
            res.state = run_state_t::timeout;
            res.error_text = fmt::format("the simulation did not finish in {} ms; output before the termination:\n{}",
                _cfg.run_timeout.count(), sim.output);
            return res;
        }
        // a non-zero exit code usually means assertion failures that the output reports
        if (sim.exit_code != 0)
            logger::warn("{}: the simulation exited with code {}", variant, sim.exit_code);
        res.state = run_state_t::completed;
        res.report = parse_output(sim.output);
        return res;
    }

    std::vector<std::string> simulator_t::missing_artifacts() const
    {
        std::vector<std::string> missing {};
        for (const auto variant: all_variants) {
            const auto &info = variant_info(variant);
            for (const auto name: { info.package, info.design, info.testbench }) {
                const auto path = (std::filesystem::path { _cfg.work_dir } / name).string();
                if (!std::filesystem::exists(path) && std::find(missing.begin(), missing.end(), path) == missing.end())
                    missing.emplace_back(path);
            }
        }
        return missing;
    }
}
