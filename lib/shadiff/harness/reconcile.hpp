#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <string>
#include <vector>
#include "simulator.hpp"
#include "test-case.hpp"

namespace shadiff::harness {
    enum class test_status_t {
        ok,
        mismatch
    };

    enum class verdict_t {
        all_match,
        differences_detected
    };

    struct variant_digest_t {
        variant_t variant;
        std::string digest;

        bool operator==(const variant_digest_t &o) const =default;
    };

    struct test_report_t {
        size_t index = 0;
        std::string name {};
        test_status_t status = test_status_t::ok;
        std::string reference_digest {};
        // only the variants that reported a digest for this test; missing ones are omitted
        std::vector<variant_digest_t> variant_digests {};
    };

    struct reconcile_result_t {
        std::vector<test_report_t> tests {};
        // variants whose pipeline failed before producing results
        std::vector<variant_t> failed_variants {};
        verdict_t verdict = verdict_t::all_match;

        [[nodiscard]] size_t num_mismatches() const noexcept;
    };

    using run_result_map_t = std::map<variant_t, run_result_t>;

    /*
     * Compares the reference digest of the i-th test case with the i-th digest reported by each
     * variant. Only the position correlates the two since the simulator does not echo test names.
     * A variant whose pipeline failed has no digests and fails every test.
     */
    extern reconcile_result_t reconcile(const test_case_list_t &cases, const run_result_map_t &results);
}

namespace fmt {
    template<>
    struct formatter<shadiff::harness::test_status_t>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const shadiff::harness::test_status_t &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(v == shadiff::harness::test_status_t::ok ? "OK" : "MISMATCH", ctx);
        }
    };

    template<>
    struct formatter<shadiff::harness::verdict_t>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const shadiff::harness::verdict_t &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(v == shadiff::harness::verdict_t::all_match ? "ALL_MATCH" : "DIFFERENCES_DETECTED", ctx);
        }
    };
}
