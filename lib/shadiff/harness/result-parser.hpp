#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <string_view>
#include <vector>

namespace shadiff::harness {
    struct parse_result_t {
        size_t passed = 0;
        size_t failed = 0;
        // in the order the testbench reported them; neither the count nor the format is validated
        std::vector<std::string> hashes {};

        bool operator==(const parse_result_t &o) const =default;
    };

    /*
     * Scans the simulator output line by line. Only the first matching rule applies to a line:
     * a line containing "PASS" counts as passed, otherwise a line containing "FAIL" counts
     * as failed, otherwise the text between the first "Hash:" and the next one or the end of the line
     * is trimmed, lowercased and recorded.
     * Other lines are ignored.
     */
    extern parse_result_t parse_output(std::string_view text);
}
