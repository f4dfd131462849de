#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <array>
#include <string>
#include "padding.hpp"

namespace shadiff::sha384 {
    static constexpr size_t word_size = sizeof(uint64_t);
    static constexpr size_t words_per_block = block_size / word_size;
    static constexpr size_t hex_word_size = word_size * 2;

    using hex_word_list_t = std::array<std::string, words_per_block>;

    struct invalid_block_size_error final: error {
        explicit invalid_block_size_error(const size_t size):
            error { fmt::format("a block must have exactly {} bytes but got {}", block_size, size) }
        {
        }
    };

    // exactly 16 lowercase hex characters, zero-padded
    extern std::string render_word(uint64_t word);
    extern uint64_t parse_word(std::string_view hex);
    extern hex_word_list_t encode_words(buffer block);
}
