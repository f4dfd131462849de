/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shadiff/common/logger.hpp>
#include "report.hpp"

namespace shadiff::harness {
    void log_run_result(const variant_t variant, const run_result_t &run, const size_t num_tests)
    {
        if (run.pipeline_failed()) {
            logger::error("{}: {}: {}", variant, run.state, run.error_text);
            return;
        }
        logger::info("{}: passed: {}/{} failed: {} digests reported: {}",
            variant, run.report.passed, num_tests, run.report.failed, run.report.hashes.size());
    }

    void log_summary(const reconcile_result_t &res, const run_result_map_t &results)
    {
        logger::info("SUMMARY");
        for (const auto variant: res.failed_variants)
            logger::error("{}: no results due to a pipeline failure: {}", variant, results.at(variant).state);
        for (const auto &t: res.tests) {
            if (t.status == test_status_t::ok) {
                logger::debug("test {} ({}): {}", t.index, t.name, t.status);
                continue;
            }
            logger::info("test {} ({}): {}", t.index, t.name, t.status);
            logger::info("    {:<10} {}", "reference:", t.reference_digest);
            for (const auto &vd: t.variant_digests)
                logger::info("    {:<10} {}", fmt::format("{}:", vd.variant), vd.digest);
        }
        if (res.verdict == verdict_t::all_match) {
            logger::info("{}: all {} tests match the reference in every variant", res.verdict, res.tests.size());
        } else {
            logger::info("{}: {} of {} tests mismatch, {} variants failed", res.verdict,
                res.num_mismatches(), res.tests.size(), res.failed_variants.size());
        }
    }
}
