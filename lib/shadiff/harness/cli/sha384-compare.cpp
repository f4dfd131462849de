/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <filesystem>
#include <shadiff/common/cli.hpp>
#include <shadiff/harness/report.hpp>
#include <shadiff/harness/vectors.hpp>
#include "options.hpp"

namespace shadiff::cli::sha384_compare {
    using namespace shadiff::harness;

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "sha384-compare";
            cmd.desc = "Compare the baseline and the optimized VHDL SHA-384 designs against the reference on random messages";
            harness_options::add_generator_options(cmd);
            cmd.opts.try_emplace("dir", "the directory with the VHDL sources; the simulator runs there", ".");
            cmd.opts.try_emplace("vectors", "the vector file name relative to the project directory", "test_vectors.txt");
            cmd.opts.try_emplace("simulator", "the VHDL simulator executable", "nvc");
            cmd.opts.try_emplace("timeout", "the time limit of a simulation run in seconds", "30");
        }

        void run(const arguments &, const options &opts) const override
        {
            const auto gen_cfg = harness_options::generator_config(opts);
            simulator_config_t sim_cfg {};
            sim_cfg.work_dir = opts.at("dir").value();
            sim_cfg.tool = opts.at("simulator").value();
            sim_cfg.run_timeout = std::chrono::seconds { from_str<uint32_t>(opts.at("timeout").value()) };

            logger::info("generating {} random test cases with messages of up to {} bytes", gen_cfg.count, gen_cfg.max_len);
            const auto cases = generate(gen_cfg);
            for (size_t i = 0; i < cases.size(); ++i)
                logger::info("test {}: {} -> {}...", i, cases[i].name, std::string_view { cases[i].expected_digest }.substr(0, 16));

            const auto vectors_path = (std::filesystem::path { sim_cfg.work_dir } / opts.at("vectors").value()).string();
            vectors::save(vectors_path, cases);
            logger::info("wrote {} test cases to {}", cases.size(), vectors_path);

            system_process_runner_t runner {};
            const simulator_t sim { runner, sim_cfg };
            if (const auto missing = sim.missing_artifacts(); !missing.empty()) {
                for (const auto &path: missing)
                    logger::error("missing VHDL source: {}", path);
                throw error(fmt::format("{} VHDL sources required by the testbenches are missing", missing.size()));
            }
            if (!find_executable(sim_cfg.tool))
                throw error(fmt::format("the simulator executable {} is not available", sim_cfg.tool));

            run_result_map_t results {};
            for (const auto variant: all_variants) {
                logger::info("running the {} design", variant);
                const auto &run = results.try_emplace(variant, sim.run(variant)).first->second;
                log_run_result(variant, run, cases.size());
            }

            const auto res = reconcile(cases, results);
            log_summary(res, results);
            if (res.verdict != verdict_t::all_match)
                throw error(fmt::format("{}", res.verdict));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
