/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <filesystem>
#include <future>
#include <memory>
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <shadiff/common/error.hpp>
#include <shadiff/common/logger.hpp>
#include "process.hpp"

namespace shadiff::harness {
    namespace bp = boost::process;

    std::optional<std::string> find_executable(const std::string &name)
    {
        if (name.find('/') != std::string::npos) {
            if (std::filesystem::is_regular_file(name))
                return name;
            return {};
        }
        const auto path = bp::search_path(name);
        if (path.empty())
            return {};
        return path.string();
    }

    template<typename T>
    static std::string ready_output(std::future<T> &fut)
    {
        if (fut.valid() && fut.wait_for(std::chrono::seconds { 0 }) == std::future_status::ready) {
            try {
                return fut.get();
            } catch (const std::exception &ex) {
                logger::debug("output of a terminated process is unavailable: {}", ex.what());
            }
        }
        return {};
    }

    process_result_t system_process_runner_t::run(const command_t &cmd)
    {
        const auto exe_path = find_executable(cmd.exe);
        if (!exe_path)
            throw error(fmt::format("can't find the executable: {}", cmd.exe));
        const std::string work_dir = cmd.work_dir.empty() ? std::string { "." } : cmd.work_dir;
        logger::trace("starting {} with {} arguments in {}", *exe_path, cmd.args.size(), work_dir);

        boost::asio::io_context ioc {};
        std::future<std::string> out_fut {};
        std::future<std::string> err_fut {};
        std::optional<int> exit_code {};
        // descendants share the group so that a termination does not leave them holding the pipes
        bp::group group {};
        std::unique_ptr<bp::child> child {};
        try {
            child = std::make_unique<bp::child>(
                bp::exe = *exe_path,
                bp::args = cmd.args,
                bp::start_dir = work_dir,
                bp::std_in.close(),
                bp::std_out > out_fut,
                bp::std_err > err_fut,
                bp::on_exit = [&exit_code](const int code, const std::error_code &ec) {
                    if (!ec)
                        exit_code = code;
                },
                group,
                ioc
            );
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to start {}", *exe_path), ex);
        }

        process_result_t res {};
        if (cmd.timeout) {
            ioc.run_for(*cmd.timeout);
            if (!ioc.stopped()) {
                const bool exited = exit_code.has_value();
                if (exited)
                    logger::warn("{} exited but its descendants are still running after {} ms; terminating them", cmd.exe, cmd.timeout->count());
                else
                    logger::warn("{} did not finish in {} ms; terminating it", cmd.exe, cmd.timeout->count());
                std::error_code ec {};
                group.terminate(ec);
                if (ec)
                    logger::error("failed to terminate the process group of {}: {}", cmd.exe, ec.message());
                // give the pipes a chance to deliver what was printed before the termination
                ioc.run_for(std::chrono::milliseconds { 200 });
                res.output = ready_output(out_fut) + ready_output(err_fut);
                res.timed_out = !exited;
                res.exit_code = exited ? *exit_code : -1;
                return res;
            }
        } else {
            ioc.run();
        }
        if (!exit_code) {
            std::error_code ec {};
            child->wait(ec);
            if (ec)
                throw error(fmt::format("failed to obtain the exit code of {}: {}", cmd.exe, ec.message()));
            exit_code = child->exit_code();
        }
        res.exit_code = *exit_code;
        res.output = out_fut.get() + err_fut.get();
        logger::trace("{} exited with code {}", cmd.exe, res.exit_code);
        return res;
    }
}
