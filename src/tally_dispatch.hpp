/*
 * File: src/tally_dispatch.hpp
 * Project: Tally Language Server
 * Purpose: Builds the agent command line for a heartbeat and runs it asynchronously
 * Notes:
 *  - Agent stdio goes to the null device; our stdout is the editor channel
 *  - Failures are reported to the completion callback, never thrown, never retried
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/process.hpp>

#include <chrono>
#include <fstream>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "common/activity.hpp"
#include "common/settings.hpp"

namespace bp = boost::process;

// Seconds since epoch with millisecond fraction, e.g. 1760000000.250
inline std::string epoch_seconds(std::chrono::system_clock::time_point t)
{
    auto secs = std::chrono::duration<double>(t.time_since_epoch()).count();
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << secs;
    return oss.str();
}

// Best effort: 0 when the file can't be read. A trailing newline does not
// start another line.
inline uint64_t count_lines(const std::string &path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
        return 0;
    uint64_t lines = 0;
    char last = '\n';
    char buf[8192];
    while (f.read(buf, sizeof(buf)) || f.gcount() > 0)
    {
        const auto n = f.gcount();
        for (std::streamsize i = 0; i < n; ++i)
        {
            if (buf[i] == '\n')
                ++lines;
        }
        last = buf[n - 1];
    }
    if (last != '\n')
        ++lines;
    return lines;
}

inline std::vector<std::string> heartbeat_args(const Heartbeat &hb, const Settings &settings, uint64_t lines_in_file)
{
    std::vector<std::string> args{"--time", epoch_seconds(hb.time), "--entity", hb.entity};

    if (!settings.plugin.empty())
    {
        args.push_back("--plugin");
        args.push_back(settings.plugin);
    }
    if (hb.is_write)
        args.push_back("--write");
    if (settings.metrics.value_or(false))
        args.push_back("--metrics");
    if (settings.api_key)
    {
        args.push_back("--key");
        args.push_back(*settings.api_key);
    }
    if (settings.api_url)
    {
        args.push_back("--api-url");
        args.push_back(*settings.api_url);
    }
    if (hb.language)
    {
        args.push_back("--language");
        args.push_back(*hb.language);
    }
    else
    {
        args.push_back("--guess-language");
    }
    if (settings.debug_enabled())
        args.push_back("--verbose");

    args.push_back("--lineno");
    args.push_back(std::to_string(hb.lineno));
    args.push_back("--cursorpos");
    args.push_back(std::to_string(hb.cursorpos));

    if (lines_in_file > 0)
    {
        args.push_back("--lines-in-file");
        args.push_back(std::to_string(lines_in_file));
    }
    return args;
}

// For log lines only; the api key is masked.
inline std::string describe_command(const std::string &exe, const std::vector<std::string> &args)
{
    std::ostringstream oss;
    oss << exe;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const bool secret = i > 0 && args[i - 1] == "--key";
        oss << ' ' << (secret ? std::string("********") : args[i]);
    }
    return oss.str();
}

// Bare names ("wakatime-cli") are looked up on PATH; anything with a
// separator is used as given.
inline std::string resolve_agent(const std::string &agent)
{
    if (agent.find('/') != std::string::npos || agent.find('\\') != std::string::npos)
        return agent;
    auto found = bp::search_path(agent);
    return found.empty() ? agent : found.string();
}

class Dispatcher
{
    boost::asio::io_context &ioc_;
    std::string exe_;

public:
    // ok == false carries a human readable reason
    using Done = std::function<void(bool ok, const std::string &why)>;

    Dispatcher(boost::asio::io_context &ioc, const std::string &agent)
        : ioc_(ioc), exe_(resolve_agent(agent)) {}

    const std::string &executable() const { return exe_; }

    void dispatch(const std::vector<std::string> &args, Done done)
    {
        try
        {
            bp::async_system(
                ioc_,
                [done](boost::system::error_code ec, int exit_code)
                {
                    if (ec)
                        done(false, "spawn failed: " + ec.message());
                    else if (exit_code != 0)
                        done(false, "exited with code " + std::to_string(exit_code));
                    else
                        done(true, std::string());
                },
                bp::exe = exe_,
                bp::args = args,
                bp::std_in < bp::null,
                bp::std_out > bp::null,
                bp::std_err > bp::null);
        }
        catch (const std::exception &e)
        {
            boost::asio::post(ioc_, [done, what = std::string(e.what())]()
                              { done(false, "spawn failed: " + what); });
        }
    }
};
