#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shadiff/common/cli.hpp>
#include <shadiff/harness/generator.hpp>

namespace shadiff::cli::harness_options {
    inline void add_generator_options(config &cmd)
    {
        cmd.opts.try_emplace("count", "the number of random test cases", "5");
        cmd.opts.try_emplace("max-len", "the maximum length of a random message in bytes", "200");
        cmd.opts.try_emplace("seed", "a seed making the random test cases reproducible");
        cmd.opts.try_emplace("boundary", "1 to add NIST and padding-boundary messages before the random ones", "0");
    }

    inline bool flag_value(const options &opts, const std::string &name)
    {
        const auto &val = opts.at(name);
        if (!val || val->empty() || *val == "1" || *val == "true")
            return val.has_value();
        if (*val == "0" || *val == "false")
            return false;
        throw error(fmt::format("option {} expects 0 or 1 but got '{}'", name, *val));
    }

    inline harness::generator_config_t generator_config(const options &opts)
    {
        harness::generator_config_t cfg {};
        cfg.count = from_str<size_t>(opts.at("count").value());
        cfg.max_len = from_str<size_t>(opts.at("max-len").value());
        if (const auto &seed = opts.at("seed"); seed)
            cfg.seed = from_str<uint64_t>(*seed);
        cfg.boundary = flag_value(opts, "boundary");
        return cfg;
    }
}
