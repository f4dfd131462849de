#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <chrono>
#include <string>
#include <string_view>
#include "logger.hpp"

namespace shadiff {
    struct timer {
        explicit timer(const std::string_view title, const logger::level lev=logger::level::debug):
            _title { title }, _level { lev }
        {
        }

        timer(const timer &) =delete;

        ~timer()
        {
            if (!_stopped)
                stop_and_print();
        }

        double stop(const bool finished=true)
        {
            if (!_stopped) {
                _end = std::chrono::steady_clock::now();
                _stopped = finished;
            }
            return std::chrono::duration<double> { _end - _start }.count();
        }

        void stop_and_print()
        {
            const auto secs = stop();
            logger::log(_level, "timer '{}' finished in {:.3f} secs", _title, secs);
        }
    private:
        const std::string _title;
        const logger::level _level;
        const std::chrono::time_point<std::chrono::steady_clock> _start = std::chrono::steady_clock::now();
        std::chrono::time_point<std::chrono::steady_clock> _end {};
        bool _stopped = false;
    };
}
