/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shadiff/common/test.hpp>
#include "result-parser.hpp"

namespace {
    using namespace shadiff;
    using namespace shadiff::harness;
}

suite shadiff_harness_result_parser_suite = [] {
    "shadiff::harness::result_parser"_test = [] {
        "pass, hash and fail lines"_test = [] {
            const std::string hash(64, 'A');
            const auto res = parse_output(fmt::format("PASS\nHash: {}\nFAIL\n", hash));
            expect_equal(size_t { 1 }, res.passed);
            expect_equal(size_t { 1 }, res.failed);
            expect_equal(size_t { 1 }, res.hashes.size());
            expect_equal(std::string(64, 'a'), res.hashes.at(0));
        };
        "simulator report lines"_test = [] {
            const auto res = parse_output(
                "** Note: 0ms+0: Test 0 Hash: CB00753F45A35E8B  \r\n"
                "** Note: 0ms+0: Test 0 PASS\r\n"
                "unrelated text\n"
                "\n"
                "Hash:\n"
                "** Note: Test 1 Hash:\tabcd\n"
                "** Error: Test 1 FAIL"
            );
            expect_equal(size_t { 1 }, res.passed);
            expect_equal(size_t { 1 }, res.failed);
            expect(res.hashes == std::vector<std::string> { "cb00753f45a35e8b", "", "abcd" });
        };
        "only the first matching rule applies"_test = [] {
            const auto res = parse_output("PASS FAIL Hash: 00\nFAIL Hash: 11\nHash: 22 Hash: 33\n");
            expect_equal(size_t { 1 }, res.passed);
            expect_equal(size_t { 1 }, res.failed);
            expect(res.hashes == std::vector<std::string> { "22" });
        };
        "a repeated hash token ends the digest"_test = [] {
            const auto res = parse_output("Test 0 Hash: ABCD Hash: 1234\nTest 1 Hash:Hash: 99\n");
            expect(res.hashes == std::vector<std::string> { "abcd", "" });
        };
        "tokens are case-sensitive"_test = [] {
            const auto res = parse_output("pass\nfail\nhash: 00\n");
            expect(res == parse_result_t {});
        };
        "empty input"_test = [] {
            expect(parse_output("") == parse_result_t {});
        };
    };
};
