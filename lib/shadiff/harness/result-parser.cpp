/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <cctype>
#include "result-parser.hpp"

namespace shadiff::harness {
    using namespace std::string_view_literals;

    static std::string_view trim(std::string_view s) noexcept
    {
        static constexpr auto ws = " \t\r\n\f\v"sv;
        const auto first = s.find_first_not_of(ws);
        if (first == std::string_view::npos)
            return {};
        const auto last = s.find_last_not_of(ws);
        return s.substr(first, last - first + 1);
    }

    static std::string to_lower(const std::string_view s)
    {
        std::string res { s };
        std::transform(res.begin(), res.end(), res.begin(), [](const unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return res;
    }

    parse_result_t parse_output(std::string_view text)
    {
        static constexpr auto hash_token = "Hash:"sv;
        parse_result_t res {};
        while (!text.empty()) {
            const auto nl = text.find('\n');
            const auto line = text.substr(0, nl);
            text.remove_prefix(nl != std::string_view::npos ? nl + 1 : text.size());
            if (line.find("PASS"sv) != std::string_view::npos) {
                ++res.passed;
            } else if (line.find("FAIL"sv) != std::string_view::npos) {
                ++res.failed;
            } else if (const auto pos = line.find(hash_token); pos != std::string_view::npos) {
                // the digest ends at the next token if a line repeats it
                auto digest = line.substr(pos + hash_token.size());
                digest = digest.substr(0, digest.find(hash_token));
                res.hashes.emplace_back(to_lower(trim(digest)));
            }
        }
        return res;
    }
}
