#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include "test-case.hpp"

namespace shadiff::harness {
    struct generator_config_t {
        size_t count = 5;
        size_t max_len = 200;
        std::optional<uint64_t> seed {};
        // NIST messages and padding-boundary lengths before the random ones
        bool boundary = false;
    };

    extern test_case_list_t fixed_cases();
    extern test_case_list_t generate(const generator_config_t &cfg);
}
