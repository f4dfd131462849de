#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <vector>
#include <shadiff/common/bytes.hpp>

namespace shadiff::sha384 {
    static constexpr size_t block_size = 128;
    // the padding ends in a 128-bit message length in bits
    static constexpr size_t length_size = 16;
    static constexpr size_t length_offset = block_size - length_size;

    using block_t = byte_array<block_size>;
    using block_list_t = std::vector<block_t>;

    struct malformed_length_error final: error {
        explicit malformed_length_error(const size_t size):
            error { fmt::format("padded message size {} is not a multiple of {}", size, block_size) }
        {
        }
    };

    /*
     * Appends 0x80, then zero bytes until the size modulo 128 equals 112,
     * then the message length in bits as a 128-bit big-endian integer.
     * The high 64 bits of the length are always zero.
     */
    extern uint8_vector pad(buffer msg);
    extern block_list_t split_blocks(buffer padded);
}
