/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shadiff/common/cli.hpp>
#include <shadiff/harness/vectors.hpp>
#include "options.hpp"

namespace shadiff::cli::sha384_vectors {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "sha384-vectors";
            cmd.desc = "Write a SHA-384 vector file for the VHDL file testbenches without running a simulator";
            cmd.args.expect({ "<vectors-path>" });
            harness_options::add_generator_options(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto cases = harness::generate(harness_options::generator_config(opts));
            harness::vectors::save(args.at(0), cases);
            for (size_t i = 0; i < cases.size(); ++i)
                logger::info("test {}: {} blocks: {} digest: {}", i, cases[i].name, cases[i].blocks.size(), cases[i].expected_digest);
            logger::info("wrote {} test cases to {}", cases.size(), args.at(0));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
