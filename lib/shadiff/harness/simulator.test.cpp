/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <deque>
#include <shadiff/common/test.hpp>
#include "simulator.hpp"

namespace {
    using namespace shadiff;
    using namespace shadiff::harness;

    struct scripted_runner_t final: process_runner_t {
        std::deque<process_result_t> replies {};
        std::vector<command_t> calls {};

        process_result_t run(const command_t &cmd) override
        {
            calls.emplace_back(cmd);
            if (replies.empty())
                throw error(fmt::format("unexpected command: {}", cmd.exe));
            auto res = std::move(replies.front());
            replies.pop_front();
            return res;
        }
    };

    simulator_config_t test_config()
    {
        simulator_config_t cfg {};
        cfg.work_dir = "/tmp/sha384-project";
        cfg.tool = "nvc";
        cfg.run_timeout = std::chrono::milliseconds { 1500 };
        return cfg;
    }
}

suite shadiff_harness_simulator_suite = [] {
    "shadiff::harness::simulator"_test = [] {
        "variant table"_test = [] {
            expect_equal(std::string_view { "sha384_file_tb" }, variant_info(variant_t::baseline).entity);
            expect_equal(std::string_view { "sha384_fast_pkg.vhd" }, variant_info(variant_t::optimized).package);
            expect_equal(std::string { "optimized" }, fmt::format("{}", variant_t::optimized));
        };
        "a successful run goes through three phases"_test = [] {
            scripted_runner_t runner {};
            runner.replies = {
                process_result_t { 0, false, "analysed" },
                process_result_t { 0, false, "" },
                process_result_t { 0, false, "Test 0 Hash: ABCD\nTest 0 PASS\n" }
            };
            const simulator_t sim { runner, test_config() };
            const auto res = sim.run(variant_t::optimized);
            expect_equal(run_state_t::completed, res.state);
            expect(!res.pipeline_failed());
            expect_equal(size_t { 1 }, res.report.passed);
            expect(res.report.hashes == std::vector<std::string> { "abcd" });
            expect_equal(size_t { 3 }, runner.calls.size());
            expect(runner.calls.at(0).args == std::vector<std::string> { "-a", "sha384_fast_pkg.vhd", "sha384_fast.vhd", "sha384_fast_file_tb.vhd" });
            expect(runner.calls.at(1).args == std::vector<std::string> { "-e", "sha384_fast_file_tb" });
            expect(runner.calls.at(2).args == std::vector<std::string> { "-r", "sha384_fast_file_tb" });
            for (const auto &call: runner.calls) {
                expect_equal(std::string { "nvc" }, call.exe);
                expect_equal(std::string { "/tmp/sha384-project" }, call.work_dir);
            }
            expect(!runner.calls.at(0).timeout);
            expect(!runner.calls.at(1).timeout);
            expect(runner.calls.at(2).timeout == std::optional { std::chrono::milliseconds { 1500 } });
        };
        "a compile failure stops the pipeline"_test = [] {
            scripted_runner_t runner {};
            runner.replies = { process_result_t { 1, false, "** Error: sha384.vhd:10: syntax error" } };
            const simulator_t sim { runner, test_config() };
            const auto res = sim.run(variant_t::baseline);
            expect_equal(run_state_t::compile_failed, res.state);
            expect(res.pipeline_failed());
            expect_equal(std::string { "** Error: sha384.vhd:10: syntax error" }, res.error_text);
            expect_equal(size_t { 1 }, runner.calls.size());
            expect(runner.calls.at(0).args.at(0) == "-a");
            expect(res.report == parse_result_t {});
        };
        "an elaborate failure stops before the run"_test = [] {
            scripted_runner_t runner {};
            runner.replies = {
                process_result_t { 0, false, "" },
                process_result_t { 2, false, "missing entity" }
            };
            const simulator_t sim { runner, test_config() };
            const auto res = sim.run(variant_t::baseline);
            expect_equal(run_state_t::elaborate_failed, res.state);
            expect_equal(std::string { "missing entity" }, res.error_text);
            expect_equal(size_t { 2 }, runner.calls.size());
        };
        "a timeout is not a completed run"_test = [] {
            scripted_runner_t runner {};
            runner.replies = {
                process_result_t { 0, false, "" },
                process_result_t { 0, false, "" },
                process_result_t { -1, true, "Test 0 PASS\nTest 0 Hash: abcd\n" }
            };
            const simulator_t sim { runner, test_config() };
            const auto res = sim.run(variant_t::baseline);
            expect_equal(run_state_t::timeout, res.state);
            expect(res.pipeline_failed());
            expect(res.report.hashes.empty());
            expect(res.error_text.find("Test 0 PASS") != std::string::npos);
        };
        "a non-zero run exit code still reports the parsed output"_test = [] {
            scripted_runner_t runner {};
            runner.replies = {
                process_result_t { 0, false, "" },
                process_result_t { 0, false, "" },
                process_result_t { 1, false, "Test 0 FAIL\nTest 0 Hash: 00\n" }
            };
            const simulator_t sim { runner, test_config() };
            const auto res = sim.run(variant_t::baseline);
            expect_equal(run_state_t::completed, res.state);
            expect_equal(size_t { 1 }, res.report.failed);
        };
        "missing_artifacts"_test = [] {
            const file::tmp_directory dir { "shadiff-simulator-test" };
            scripted_runner_t runner {};
            simulator_config_t cfg {};
            cfg.work_dir = dir.path().string();
            const simulator_t sim { runner, cfg };
            expect_equal(size_t { 6 }, sim.missing_artifacts().size());
            for (const auto name: { "sha384_pkg.vhd", "sha384.vhd", "sha384_file_tb.vhd", "sha384_fast_pkg.vhd", "sha384_fast.vhd" })
                file::write((dir.path() / name).string(), std::string_view { "-- vhdl" });
            const auto missing = sim.missing_artifacts();
            expect_equal(size_t { 1 }, missing.size());
            expect(missing.at(0).ends_with("sha384_fast_file_tb.vhd"));
            expect(runner.calls.empty());
        };
    };
};
