/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <openssl/evp.h>
#include "sha384.hpp"

namespace shadiff::crypto::sha384 {
    void digest(const hash_span_t &out, const buffer &in)
    {
        unsigned int out_len = 0;
        if (EVP_Digest(in.data(), in.size(), out.data(), &out_len, EVP_sha384(), nullptr) != 1) [[unlikely]]
            throw error("openssl error: can't compute a sha384 hash!");
        if (out_len != out.size()) [[unlikely]]
            throw error(fmt::format("openssl returned a sha384 hash of {} bytes instead of {}", out_len, out.size()));
    }
}
