/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <shadiff/harness/cli/options.hpp>
#include "cli.hpp"
#include "test.hpp"

namespace {
    using namespace shadiff;
    using namespace shadiff::cli;

    struct echo_cmd: command {
        static arguments &last_args()
        {
            static arguments args {};
            return args;
        }

        static options &last_opts()
        {
            static options opts {};
            return opts;
        }

        void configure(config &cmd) const override
        {
            cmd.name = "test-echo";
            cmd.desc = "records its arguments";
            cmd.args.expect({ "<first>", "[<rest> ...]" });
            cmd.opts.try_emplace("mode", "how to finish", "ok");
        }

        void run(const arguments &args, const options &opts) const override
        {
            last_args() = args;
            last_opts() = opts;
            if (opts.at("mode") == "fail")
                throw error("asked to fail");
        }
    };
    static auto echo_instance = command::reg(std::make_shared<echo_cmd>());
}

suite shadiff_common_cli_suite = [] {
    "shadiff::common::cli"_test = [] {
        "argument_config::expect"_test = [] {
            argument_config args {};
            args.expect({ "<vectors>", "<baseline-log>", "<optimized-log>" });
            expect_equal(size_t { 3 }, args.min);
            expect(args.max == size_t { 3 });
            args.expect({ "<path>", "[<dir>]" });
            expect_equal(size_t { 1 }, args.min);
            expect(args.max == size_t { 2 });
            expect_equal(std::string { "<path> [<dir>]" }, args.desc);
            args.expect({ "[<file> ...]" });
            expect_equal(size_t { 0 }, args.min);
            expect(!args.max.has_value());
        };
        "make_usage"_test = [] {
            config cfg {};
            cfg.name = "sha384-vectors";
            cfg.args.expect({ "<path>" });
            harness_options::add_generator_options(cfg);
            expect_equal(std::string { "sha384-vectors <path> [--boundary=0] [--count=5] [--max-len=200] [--seed=<value>]" },
                cfg.make_usage());
        };
        "generator options"_test = [] {
            options opts { { "count", "7" }, { "max-len", "33" }, { "seed", "18446744073709551615" }, { "boundary", "" } };
            const auto cfg = harness_options::generator_config(opts);
            expect_equal(size_t { 7 }, cfg.count);
            expect_equal(size_t { 33 }, cfg.max_len);
            expect(cfg.seed == std::numeric_limits<uint64_t>::max());
            expect(cfg.boundary);
            opts["boundary"] = "0";
            opts["seed"].reset();
            const auto cfg2 = harness_options::generator_config(opts);
            expect(!cfg2.boundary);
            expect(!cfg2.seed.has_value());
            opts["boundary"] = "maybe";
            expect(throws([&] { harness_options::generator_config(opts); }));
            opts["boundary"] = "1";
            opts["count"] = "-1";
            expect(throws([&] { harness_options::generator_config(opts); }));
        };
        "run"_test = [] {
            {
                const char *argv[] { "shadiff", "test-echo", "a", "--mode", "b", "c" };
                expect_equal(0, run(6, argv));
                expect(echo_cmd::last_args() == arguments { "a", "b", "c" });
                expect(echo_cmd::last_opts().at("mode") == std::string {});
            }
            {
                const char *argv[] { "shadiff", "test-echo", "x" };
                expect_equal(0, run(3, argv));
                expect(echo_cmd::last_opts().at("mode") == std::string { "ok" });
            }
            {
                const char *argv[] { "shadiff", "test-echo", "x", "--mode=fail" };
                expect_equal(1, run(4, argv));
            }
            {
                const char *argv[] { "shadiff", "test-echo" };
                expect_equal(1, run(2, argv));
            }
            {
                const char *argv[] { "shadiff", "test-echo", "x", "--unknown=1" };
                expect_equal(1, run(4, argv));
            }
            {
                const char *argv[] { "shadiff", "no-such-command" };
                expect_equal(1, run(2, argv));
            }
        };
    };
};
