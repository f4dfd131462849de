/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iterator>
#include <shadiff/common/file.hpp>
#include <shadiff/common/logger.hpp>
#include <shadiff/common/numeric-cast.hpp>
#include <shadiff/sha384/block-encoder.hpp>
#include "vectors.hpp"

namespace shadiff::harness::vectors {
    using sha384::hex_word_size;

    std::string serialize(const test_case_list_t &cases)
    {
        std::string res {};
        auto out_it = std::back_inserter(res);
        fmt::format_to(out_it, "{}\n", cases.size());
        for (const auto &tc: cases) {
            if (tc.expected_digest.size() != digest_hex_size) [[unlikely]]
                throw error(fmt::format("test case {}: the expected digest must have {} characters but has {}",
                    tc.name, digest_hex_size, tc.expected_digest.size()));
            fmt::format_to(out_it, "{}\n", tc.blocks.size());
            for (const auto &block: tc.blocks) {
                for (const auto &word: sha384::encode_words(block))
                    fmt::format_to(out_it, "{}\n", word);
            }
            for (size_t off = 0; off < digest_hex_size; off += hex_word_size)
                fmt::format_to(out_it, "{}\n", std::string_view { tc.expected_digest }.substr(off, hex_word_size));
        }
        return res;
    }

    void save(const std::string &path, const test_case_list_t &cases)
    {
        const auto text = serialize(cases);
        file::write(path, text);
        logger::debug("saved {} test cases ({} bytes) to {}", cases.size(), text.size(), path);
    }

    namespace {
        struct line_reader_t {
            explicit line_reader_t(const std::string_view text):
                _buf { text }
            {
            }

            std::string_view next(const std::string_view what)
            {
                if (_buf.empty()) [[unlikely]]
                    throw error(fmt::format("line {}: unexpected end of the vector file while reading {}", _line_no + 1, what));
                const auto nl = _buf.find('\n');
                const auto pos = nl != std::string_view::npos ? nl : _buf.size();
                const bool has_cr = pos > 0 && _buf[pos - 1] == '\r';
                const auto line = _buf.substr(0, pos - static_cast<size_t>(has_cr));
                _buf.remove_prefix(nl != std::string_view::npos ? pos + 1 : pos);
                ++_line_no;
                return line;
            }

            size_t next_count(const std::string_view what)
            {
                const auto line = next(what);
                try {
                    return from_str<size_t>(std::string { line });
                } catch (const std::exception &ex) {
                    throw error(fmt::format("line {}: invalid {}: '{}'", _line_no, what, line), ex);
                }
            }

            std::string_view next_word(const std::string_view what)
            {
                const auto line = next(what);
                if (line.size() != hex_word_size || line.find_first_not_of("0123456789abcdef") != std::string_view::npos) [[unlikely]]
                    throw error(fmt::format("line {}: {} must be {} lowercase hex characters but got '{}'", _line_no, what, hex_word_size, line));
                return line;
            }

            bool eof() const noexcept
            {
                return _buf.empty();
            }

            size_t line_no() const noexcept
            {
                return _line_no;
            }
        private:
            std::string_view _buf;
            size_t _line_no = 0;
        };
    }

    entry_list_t parse(const std::string_view text)
    {
        line_reader_t reader { text };
        const auto num_cases = reader.next_count("the number of test cases");
        entry_list_t entries {};
        for (size_t i = 0; i < num_cases; ++i) {
            auto &entry = entries.emplace_back();
            const auto num_blocks = reader.next_count(fmt::format("the number of blocks of test case {}", i));
            entry.blocks.resize(num_blocks);
            for (auto &block: entry.blocks) {
                for (size_t w = 0; w < sha384::words_per_block; ++w) {
                    const auto word = sha384::parse_word(reader.next_word(fmt::format("a block word of test case {}", i)));
                    store_be64(std::span { block.data() + w * sha384::word_size, sha384::word_size }, word);
                }
            }
            entry.expected_digest.reserve(digest_hex_size);
            for (size_t w = 0; w < digest_words; ++w)
                entry.expected_digest += reader.next_word(fmt::format("a digest word of test case {}", i));
        }
        if (!reader.eof()) [[unlikely]]
            throw error(fmt::format("line {}: unexpected data after the last test case", reader.line_no() + 1));
        return entries;
    }

    entry_list_t load(const std::string &path)
    {
        const auto bytes = file::read(path);
        try {
            return parse(bytes.str());
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to parse the vector file {}", path), ex);
        }
    }
}
