/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "file.hpp"

namespace shadiff::file {
    std::string install_path(const std::string_view rel_path)
    {
        if (std::filesystem::path { rel_path }.is_absolute())
            return std::string { rel_path };
        // relative to the working directory until there is an installation layout
        return fmt::format("./{}", rel_path);
    }

    uint8_vector read(const std::string &path)
    {
        std::error_code ec {};
        const auto sz = std::filesystem::file_size(path, ec);
        if (ec)
            throw error(fmt::format("failed to get the size of {}: {}", path, ec.message()));
        uint8_vector buf(static_cast<size_t>(sz));
        read_stream is { path };
        if (const auto num_read = is.read(buf.data(), buf.size()); num_read != buf.size())
            throw error(fmt::format("expected to read {} bytes from {} but got {}", buf.size(), path, num_read));
        return buf;
    }

    void write(const std::string &path, const buffer data)
    {
        if (const auto parent = std::filesystem::path { path }.parent_path(); !parent.empty())
            std::filesystem::create_directories(parent);
        // write to a temporary file first so that readers never see a partially written file
        const auto tmp_path = fmt::format("{}.tmp", path);
        try {
            {
                write_stream os { tmp_path };
                os.write(data);
                os.close();
            }
            std::filesystem::rename(tmp_path, path);
        } catch (const std::exception &ex) {
            std::error_code ec {};
            std::filesystem::remove(tmp_path, ec);
            throw error(fmt::format("failed to write {}", path), ex);
        }
    }
}
