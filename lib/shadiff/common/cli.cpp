/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include <tuple>
#include "cli.hpp"

namespace shadiff::cli {
    using command_map = std::map<std::string, std::pair<config, command::ptr>>;

    static command_map &registry()
    {
        static command_map commands {};
        return commands;
    }

    void argument_config::expect(const std::initializer_list<std::string> names)
    {
        min = 0;
        max = 0;
        desc.clear();
        for (const auto &name: names) {
            if (!desc.empty())
                desc += ' ';
            desc += name;
            if (name.ends_with("...]")) {
                max.reset();
            } else if (name.starts_with('[')) {
                if (max)
                    ++*max;
            } else {
                ++min;
                if (max)
                    ++*max;
            }
        }
    }

    std::string config::make_usage() const
    {
        std::string usage = fmt::format("{}", name);
        if (!args.desc.empty())
            usage += fmt::format(" {}", args.desc);
        for (const auto &[opt_name, opt]: opts) {
            if (opt.default_value)
                usage += fmt::format(" [--{}={}]", opt_name, *opt.default_value);
            else
                usage += fmt::format(" [--{}=<value>]", opt_name);
        }
        return usage;
    }

    bool command::reg(const ptr &cmd)
    {
        config cfg {};
        cmd->configure(cfg);
        if (cfg.name.empty())
            throw error("a command must have a name!");
        auto [it, created] = registry().try_emplace(cfg.name, cfg, cmd);
        if (!created)
            throw error(fmt::format("a command with name {} has already been registered!", cfg.name));
        return true;
    }

    static void print_usage(const char *exec_name)
    {
        std::cerr << fmt::format("Usage: {} <command> [<arg> ...] [--<option>=<value> ...], where <command> is one of:\n", exec_name);
        for (const auto &[name, info]: registry()) {
            std::cerr << fmt::format("    {}\n", info.first.make_usage());
            std::cerr << fmt::format("        {}\n", info.first.desc);
        }
    }

    static std::pair<arguments, options> parse(const config &cfg, const int argc, const char **argv)
    {
        arguments args {};
        options opts {};
        for (const auto &[name, opt]: cfg.opts)
            opts.try_emplace(name, opt.default_value);
        for (int i = 2; i < argc; ++i) {
            const std::string_view arg { argv[i] };
            if (!arg.starts_with("--")) {
                args.emplace_back(arg);
                continue;
            }
            const auto body = arg.substr(2);
            const auto eq_pos = body.find('=');
            const std::string name { body.substr(0, eq_pos) };
            if (!cfg.opts.contains(name))
                throw error(fmt::format("unsupported option '{}' for command {}", name, cfg.name));
            if (eq_pos != std::string_view::npos)
                opts[name] = std::string { body.substr(eq_pos + 1) };
            else
                opts[name] = std::string {};
        }
        if (args.size() < cfg.args.min)
            throw error(fmt::format("command {} expects at least {} arguments but got {}", cfg.name, cfg.args.min, args.size()));
        if (cfg.args.max && args.size() > *cfg.args.max)
            throw error(fmt::format("command {} expects at most {} arguments but got {}", cfg.name, *cfg.args.max, args.size()));
        return { std::move(args), std::move(opts) };
    }

    int run(const int argc, const char **argv)
    {
        if (argc < 2) {
            print_usage(argv[0]);
            return 1;
        }
        const std::string cmd_name { argv[1] };
        const auto it = registry().find(cmd_name);
        if (it == registry().end()) {
            std::cerr << fmt::format("Unknown command: '{}'\n", cmd_name);
            print_usage(argv[0]);
            return 1;
        }
        const auto &[cfg, cmd] = it->second;
        arguments args {};
        options opts {};
        try {
            std::tie(args, opts) = parse(cfg, argc, argv);
        } catch (const std::exception &ex) {
            logger::error("{}", ex.what());
            logger::info("usage: {}", cfg.make_usage());
            return 1;
        }
        try {
            logger::debug("running command {} with {} arguments", cfg.name, args.size());
            cmd->run(args, opts);
            return 0;
        } catch (const std::exception &ex) {
            logger::error("{} failed: {}", cfg.name, ex.what());
            return 1;
        }
    }
}
