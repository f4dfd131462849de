#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include "bytes.hpp"
#include "error.hpp"
#include "format.hpp"

namespace shadiff::file {
    struct stream {
        stream(const stream &) =delete;
        stream &operator=(const stream &) =delete;

        explicit stream(const std::string &path, const char *mode):
            _path { path }, _f { std::fopen(path.c_str(), mode) }
        {
            if (!_f)
                throw error_sys(fmt::format("failed to open file {} in mode {}", path, mode));
        }

        ~stream()
        {
            if (_f)
                std::fclose(_f);
        }

        const std::string &path() const noexcept
        {
            return _path;
        }
    protected:
        std::string _path;
        FILE *_f;
    };

    struct read_stream: stream {
        explicit read_stream(const std::string &path):
            stream { path, "rb" }
        {
        }

        size_t read(void *data, const size_t num_bytes)
        {
            const auto num_read = std::fread(data, 1, num_bytes, _f);
            if (num_read != num_bytes && std::ferror(_f))
                throw error_sys(fmt::format("failed to read from {}", _path));
            return num_read;
        }
    };

    struct write_stream: stream {
        explicit write_stream(const std::string &path):
            stream { path, "wb" }
        {
        }

        void write(const buffer data)
        {
            if (data.empty())
                return;
            if (std::fwrite(data.data(), 1, data.size(), _f) != data.size())
                throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), _path));
        }

        void close()
        {
            const auto res = std::fclose(_f);
            _f = nullptr;
            if (res != 0)
                throw error_sys(fmt::format("failed to close {}", _path));
        }
    };

    struct tmp {
        explicit tmp(const std::string_view name):
            _path { (std::filesystem::temp_directory_path() / name).string() }
        {
        }

        tmp(const tmp &) =delete;

        ~tmp()
        {
            std::error_code ec {};
            std::filesystem::remove(_path, ec);
        }

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };

    struct tmp_directory {
        explicit tmp_directory(const std::string_view name):
            _path { std::filesystem::temp_directory_path() / name }
        {
            std::filesystem::remove_all(_path);
            std::filesystem::create_directories(_path);
        }

        tmp_directory(const tmp_directory &) =delete;

        ~tmp_directory()
        {
            std::error_code ec {};
            std::filesystem::remove_all(_path, ec);
        }

        const std::filesystem::path &path() const noexcept
        {
            return _path;
        }

        operator const std::filesystem::path &() const noexcept
        {
            return _path;
        }
    private:
        std::filesystem::path _path;
    };

    extern std::string install_path(std::string_view rel_path);
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, buffer data);
}
