/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shadiff/common/test.hpp>
#include "sha384.hpp"

namespace {
    using namespace shadiff;
    using namespace crypto::sha384;
}

suite shadiff_crypto_sha384_suite = [] {
    "shadiff::crypto::sha384"_test = [] {
        "known answers"_test = [] {
            using test_vector = std::pair<std::string_view, std::string_view>;
            static const std::vector test_vectors = {
                test_vector { "38b060a751ac96384cd9327eb1b1e36a21fdb71114be07434c0cc7bf63f6e1da274edebfe76f65fbd51ad2f14898b95b", "" },
                test_vector { "cb00753f45a35e8bb5a03d699ac65007272c32ab0eded1631a8b605a43ff5bed8086072ba1e7cc2358baeca134c825a7", "abc" },
                test_vector { "09330c33f71147e83d192fc782cd1b4753111b173b3b05d22fa08086e3b0f712fcc7c71a557e2db966c3e9fa91746039",
                    "abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmnhijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu" }
            };
            for (const auto &[exp_hex, input]: test_vectors) {
                expect_equal(std::string { exp_hex }, digest_hex(input));
                expect(hash_t::from_hex(exp_hex) == digest(input));
            }
        };
        "digest_hex is lowercase and 96 characters long"_test = [] {
            const auto hex = digest_hex(std::string_view { "\x00\xff", 2 });
            expect_equal(size_t { 96 }, hex.size());
            expect(hex.find_first_not_of("0123456789abcdef") == std::string::npos);
        };
    };
};
