/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shadiff/crypto/sha384.hpp>
#include "test-case.hpp"

namespace shadiff::harness {
    template<typename T, typename F>
    static T run_stage(const std::string_view test_name, const std::string_view stage, const F &f)
    {
        try {
            return f();
        } catch (const std::exception &ex) {
            throw error(fmt::format("test case {}: {} failed", test_name, stage), ex);
        }
    }

    test_case_t make_test_case(std::string name, const buffer msg)
    {
        auto expected_digest = run_stage<std::string>(name, "reference digest", [&] {
            return crypto::sha384::digest_hex(msg);
        });
        const auto padded = run_stage<uint8_vector>(name, "padding", [&] {
            return sha384::pad(msg);
        });
        auto blocks = run_stage<sha384::block_list_t>(name, "block splitting", [&] {
            return sha384::split_blocks(padded);
        });
        return { std::move(name), std::move(blocks), std::move(expected_digest) };
    }
}
