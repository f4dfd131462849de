/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include "reconcile.hpp"

namespace shadiff::harness {
    size_t reconcile_result_t::num_mismatches() const noexcept
    {
        return static_cast<size_t>(std::count_if(tests.begin(), tests.end(), [](const auto &t) {
            return t.status == test_status_t::mismatch;
        }));
    }

    reconcile_result_t reconcile(const test_case_list_t &cases, const run_result_map_t &results)
    {
        reconcile_result_t res {};
        for (const auto &[variant, run]: results) {
            if (run.pipeline_failed())
                res.failed_variants.emplace_back(variant);
        }
        res.tests.reserve(cases.size());
        for (size_t i = 0; i < cases.size(); ++i) {
            const auto &tc = cases[i];
            auto &rep = res.tests.emplace_back(test_report_t { i, tc.name, test_status_t::ok, tc.expected_digest });
            for (const auto &[variant, run]: results) {
                const auto &hashes = run.report.hashes;
                const bool variant_ok = i < hashes.size() && hashes[i] == tc.expected_digest;
                if (!variant_ok)
                    rep.status = test_status_t::mismatch;
                if (i < hashes.size())
                    rep.variant_digests.emplace_back(variant_digest_t { variant, hashes[i] });
            }
        }
        if (!res.failed_variants.empty() || res.num_mismatches() > 0)
            res.verdict = verdict_t::differences_detected;
        return res;
    }
}
