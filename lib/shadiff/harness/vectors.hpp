#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <string_view>
#include "test-case.hpp"

/*
 * The vector file consumed by the VHDL file testbenches. Plain text, one value per line:
 *   <number of test cases>
 *   for every test case:
 *     <number of blocks>
 *     16 lines per block: 64-bit big-endian words as 16 lowercase hex characters
 *     6 lines: the expected digest sliced into 16-character chunks
 * There are no comments and no blank lines. The testbenches report results
 * in the same order, which is the only way to correlate them with the test cases.
 */
namespace shadiff::harness::vectors {
    static constexpr size_t digest_words = digest_hex_size / 16;

    struct entry_t {
        sha384::block_list_t blocks {};
        std::string expected_digest {};
    };
    using entry_list_t = std::vector<entry_t>;

    extern std::string serialize(const test_case_list_t &cases);
    // replaces the file if it exists
    extern void save(const std::string &path, const test_case_list_t &cases);

    extern entry_list_t parse(std::string_view text);
    extern entry_list_t load(const std::string &path);
}
