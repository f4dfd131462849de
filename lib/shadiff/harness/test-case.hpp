#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <vector>
#include <shadiff/sha384/padding.hpp>

namespace shadiff::harness {
    static constexpr size_t digest_hex_size = 96;

    struct test_case_t {
        std::string name {};
        sha384::block_list_t blocks {};
        // lowercase hex, digest_hex_size characters
        std::string expected_digest {};
    };
    using test_case_list_t = std::vector<test_case_t>;

    // The reference digest comes from the crypto module, the blocks from the padder.
    extern test_case_t make_test_case(std::string name, buffer msg);
}
