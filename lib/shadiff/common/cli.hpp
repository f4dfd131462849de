#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "error.hpp"
#include "logger.hpp"
#include "numeric-cast.hpp"

namespace shadiff::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    struct option_config {
        std::string desc {};
        std::optional<std::string> default_value {};

        option_config(std::string d):
            desc { std::move(d) }
        {
        }

        option_config(std::string d, std::string def):
            desc { std::move(d) }, default_value { std::move(def) }
        {
        }
    };
    using option_config_map = std::map<std::string, option_config>;

    struct argument_config {
        size_t min = 0;
        std::optional<size_t> max = 0;
        std::string desc {};

        // "[<x> ...]" makes the number of arguments unbounded; "[<x>]" makes it optional
        void expect(std::initializer_list<std::string> names);
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        option_config_map opts {};

        std::string make_usage() const;
    };

    struct command {
        using ptr = std::shared_ptr<command>;
        static bool reg(const ptr &cmd);

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;

        virtual void run(const arguments &) const
        {
            throw error("the command must override one of the run methods!");
        }

        virtual void run(const arguments &args, const options &) const
        {
            run(args);
        }
    };

    extern int run(int argc, const char **argv);
}
