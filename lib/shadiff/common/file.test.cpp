/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "file.hpp"
#include "test.hpp"

namespace {
    using namespace shadiff;
    using namespace std::string_view_literals;
}

suite shadiff_common_file_suite = [] {
    "shadiff::common::file"_test = [] {
        "write and read"_test = [] {
            const file::tmp_directory dir { "shadiff-file-test" };
            const auto path = (dir.path() / "sub" / "data.txt").string();
            file::write(path, "first"sv);
            file::write(path, "second"sv);
            expect_equal(std::string { "second" }, file::read(path).str());
            expect(!std::filesystem::exists(path + ".tmp"));
        };
        "a failed write leaves no temporary file"_test = [] {
            const file::tmp_directory dir { "shadiff-file-test" };
            // a non-empty directory can't be replaced by a file
            const auto target = dir.path() / "busy";
            std::filesystem::create_directories(target / "nested");
            expect(throws([&] { file::write(target.string(), "data"sv); }));
            expect(!std::filesystem::exists(target.string() + ".tmp"));
            expect(std::filesystem::is_directory(target));
        };
        "reading a missing file"_test = [] {
            expect(throws([] { file::read("/no/such/dir/shadiff.txt"); }));
        };
        "install_path"_test = [] {
            expect_equal(std::string { "/abs/log.txt" }, file::install_path("/abs/log.txt"));
            expect_equal(std::string { "./log/shadiff.log" }, file::install_path("log/shadiff.log"));
        };
    };
};
