#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "reconcile.hpp"

namespace shadiff::harness {
    extern void log_run_result(variant_t variant, const run_result_t &run, size_t num_tests);
    // lists every mismatching test with all the digests available for it
    extern void log_summary(const reconcile_result_t &res, const run_result_map_t &results);
}
