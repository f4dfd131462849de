/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdlib>
#include <shadiff/common/test.hpp>
#include "logger.hpp"

using namespace shadiff;

suite shadiff_common_logger_suite = [] {
    "shadiff::common::logger"_test = [] {
        "api"_test = [] {
            // checks that the code compiles and does not fail
            logger::trace("OK - trace");
            logger::trace("OK - {}", "trace");
            logger::debug("OK - {} {}", "debug", 2);
            logger::info("OK - info");
            logger::warn("OK - {}", "warn");
            logger::error("OK - {}", "error");
            expect(true);
        };
        "tracing_enabled"_test = [] {
            expect_equal(std::getenv("SHADIFF_DEBUG") != nullptr, logger::tracing_enabled());
        };
        "log_path"_test = [] {
            const auto path = logger::log_path();
            if (const char *env_path = std::getenv("SHADIFF_LOG"); env_path)
                expect(path.ends_with(env_path)) << path;
            else
                expect_equal(std::string { "./log/shadiff.log" }, path);
        };
    };
};
