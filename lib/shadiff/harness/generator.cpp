/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <random>
#include <shadiff/common/logger.hpp>
#include "generator.hpp"

namespace shadiff::harness {
    static void add_case(test_case_list_t &cases, std::string name, const buffer msg)
    {
        try {
            cases.emplace_back(make_test_case(std::move(name), msg));
        } catch (const std::exception &ex) {
            throw error(fmt::format("test #{}", cases.size()), ex);
        }
    }

    test_case_list_t fixed_cases()
    {
        using namespace std::string_view_literals;
        test_case_list_t cases {};
        add_case(cases, "nist_empty", ""sv);
        add_case(cases, "nist_abc", "abc"sv);
        add_case(cases, "nist_896bit",
            "abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmnhijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu"sv);
        // the lengths around which the number of padded blocks changes
        for (const size_t len: { 111, 112, 127, 128, 239, 240 }) {
            uint8_vector msg(len);
            for (size_t i = 0; i < len; ++i)
                msg[i] = static_cast<uint8_t>(i);
            add_case(cases, fmt::format("boundary_{}b", len), msg);
        }
        return cases;
    }

    test_case_list_t generate(const generator_config_t &cfg)
    {
        test_case_list_t cases {};
        if (cfg.boundary)
            cases = fixed_cases();
        const auto seed = cfg.seed ? *cfg.seed : std::random_device {}();
        logger::debug("generating {} random test cases with seed {}", cfg.count, seed);
        std::mt19937_64 rng { seed };
        std::uniform_int_distribution<size_t> len_dist { 0, cfg.max_len };
        std::uniform_int_distribution<unsigned> byte_dist { 0, 0xFF };
        cases.reserve(cases.size() + cfg.count);
        for (size_t i = 0; i < cfg.count; ++i) {
            const auto len = len_dist(rng);
            uint8_vector msg(len);
            for (auto &b: msg)
                b = static_cast<uint8_t>(byte_dist(rng));
            add_case(cases, fmt::format("random_{}b", len), msg);
        }
        return cases;
    }
}
