/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shadiff/common/cli.hpp>
#include <shadiff/common/file.hpp>
#include <shadiff/harness/report.hpp>
#include <shadiff/harness/vectors.hpp>

namespace shadiff::cli::sha384_reconcile {
    using namespace shadiff::harness;

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "sha384-reconcile";
            cmd.desc = "Reconcile saved simulator output of both designs with an existing vector file";
            cmd.args.expect({ "<vectors-path>", "<baseline-log>", "<optimized-log>" });
        }

        void run(const arguments &args) const override
        {
            const auto entries = vectors::load(args.at(0));
            test_case_list_t cases {};
            cases.reserve(entries.size());
            for (size_t i = 0; i < entries.size(); ++i)
                cases.emplace_back(test_case_t { fmt::format("vector_{}", i), entries[i].blocks, entries[i].expected_digest });
            logger::info("loaded {} test cases from {}", cases.size(), args.at(0));

            run_result_map_t results {};
            for (size_t vi = 0; vi < all_variants.size(); ++vi) {
                const auto variant = all_variants[vi];
                const auto &log_path = args.at(vi + 1);
                run_result_t run {};
                try {
                    run.report = parse_output(file::read(log_path).str());
                    run.state = run_state_t::completed;
                } catch (const std::exception &ex) {
                    // stays incomplete: there are no digests for this variant
                    run.state = run_state_t::running;
                    run.error_text = fmt::format("can't read {}: {}", log_path, ex.what());
                }
                log_run_result(variant, run, cases.size());
                results.try_emplace(variant, std::move(run));
            }

            const auto res = reconcile(cases, results);
            log_summary(res, results);
            if (res.verdict != verdict_t::all_match)
                throw error(fmt::format("{}", res.verdict));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
