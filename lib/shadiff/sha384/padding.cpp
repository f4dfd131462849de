/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shadiff/common/numeric-cast.hpp>
#include "padding.hpp"

namespace shadiff::sha384 {
    uint8_vector pad(const buffer msg)
    {
        const auto bit_len = numeric_cast<uint64_t>(msg.size()) * 8;
        uint8_vector res {};
        res.reserve(msg.size() + 2 * block_size);
        res << msg;
        res << uint8_t { 0x80 };
        while (res.size() % block_size != length_offset)
            res << uint8_t { 0x00 };
        res.resize(res.size() + sizeof(uint64_t), 0);
        res.resize(res.size() + sizeof(uint64_t));
        store_be64(std::span { res.data() + res.size() - sizeof(uint64_t), sizeof(uint64_t) }, bit_len);
        return res;
    }

    block_list_t split_blocks(const buffer padded)
    {
        if (padded.size() % block_size != 0) [[unlikely]]
            throw malformed_length_error { padded.size() };
        block_list_t blocks {};
        blocks.reserve(padded.size() / block_size);
        for (size_t off = 0; off < padded.size(); off += block_size)
            blocks.emplace_back(padded.subbuf(off, block_size));
        return blocks;
    }
}
