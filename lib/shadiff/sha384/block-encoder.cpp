/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "block-encoder.hpp"

namespace shadiff::sha384 {
    std::string render_word(const uint64_t word)
    {
        return fmt::format("{:016x}", word);
    }

    uint64_t parse_word(const std::string_view hex)
    {
        if (hex.size() != hex_word_size) [[unlikely]]
            throw error(fmt::format("a hex word must have {} characters but got {}: '{}'", hex_word_size, hex.size(), hex));
        uint64_t word = 0;
        for (const auto k: hex)
            word = (word << 4) | uint_from_hex(k);
        return word;
    }

    hex_word_list_t encode_words(const buffer block)
    {
        if (block.size() != block_size) [[unlikely]]
            throw invalid_block_size_error { block.size() };
        hex_word_list_t words {};
        for (size_t i = 0; i < words.size(); ++i)
            words[i] = render_word(load_be64(block.subbuf(i * word_size, word_size)));
        return words;
    }
}
