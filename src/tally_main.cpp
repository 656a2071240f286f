/*
 * File: src/tally_main.cpp
 * Project: Tally Language Server
 * Purpose: Server binary: speaks the editor protocol on stdio, reports heartbeats via wakatime-cli
 * Notes:
 *  - stdout carries protocol frames only; diagnostics go to stderr
 *  - Settings arrive with the editor's initialize request, not on the command line
 * Last updated: 2026-10-19
 */

#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <boost/asio.hpp>
#include "tally_dispatch.hpp"
#include "tally_lsp.hpp"
#include "tally_state.hpp"

static void print_usage()
{
    std::cout << "tally_ls " << TALLY_VERSION << "\n"
              << "A WakaTime language server: forwards editing heartbeats to wakatime-cli\n\n"
              << "  -p, --wakatime-cli <path>  wakatime-cli executable (required)\n"
              << "      --threads <n>          worker threads (default 2)\n"
              << "      --version              print version and exit\n"
              << "  -h, --help                 print this help and exit\n";
}

int main(int argc, char **argv)
{
    std::string agent;
    int threads = 2;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if ((a == "--wakatime-cli" || a == "-p") && i + 1 < argc)
            agent = argv[++i];
        else if (a == "--threads" && i + 1 < argc)
        {
            try
            {
                threads = std::stoi(argv[++i]);
            }
            catch (const std::exception &)
            {
                std::cerr << "ERROR: --threads expects a number, got '" << argv[i] << "'\n";
                return 2;
            }
        }
        else if (a == "--version")
        {
            std::cout << "tally_ls " << TALLY_VERSION << "\n";
            return 0;
        }
        else if (a == "--help" || a == "-h")
        {
            print_usage();
            return 0;
        }
        else
        {
            std::cerr << "ERROR: unexpected argument '" << a << "'\n";
            print_usage();
            return 2;
        }
    }
    if (agent.empty())
    {
        std::cerr << "ERROR: --wakatime-cli is required\n";
        print_usage();
        return 2;
    }
    if (threads < 1)
        threads = 1;

    try
    {
        boost::asio::io_context ioc;
        TallyState state;
        state.io = &ioc;
        state.agent_path = agent;

        boost::asio::posix::stream_descriptor out{ioc, dup_cloexec(STDOUT_FILENO)};
        LspClient client{[&out](const std::string &frame)
                         {
                             boost::system::error_code ec;
                             boost::asio::write(out, boost::asio::buffer(frame), ec);
                             if (ec)
                                 std::cerr << "WARN: write to editor failed: " << ec.message() << "\n";
                         },
                         state.settings};

        Dispatcher dispatcher{ioc, state.agent_path};
        if (dispatcher.executable() == state.agent_path && state.agent_path.find('/') == std::string::npos)
            std::cerr << "WARN: " << state.agent_path << " not found on PATH; heartbeats will fail until it is installed\n";

        std::atomic<int> exit_code{1};
        LspSession session{state, client, dispatcher, [&](int code)
                           {
                               exit_code = code;
                               ioc.stop();
                           }};
        StdioServer server{ioc, STDIN_FILENO, session, [&]()
                           {
                               exit_code = session.shutdown_requested() ? 0 : 1;
                               ioc.stop();
                           }};
        server.start();

        std::cerr << "tally_ls " << TALLY_VERSION << " agent=" << dispatcher.executable() << " threads=" << threads << "\n";

        std::vector<std::thread> pool;
        for (int i = 1; i < threads; ++i)
            pool.emplace_back([&ioc]()
                              { ioc.run(); });
        ioc.run();
        for (auto &t : pool)
            t.join();
        return exit_code;
    }
    catch (const std::exception &e)
    {
        std::cerr << "tally_ls error: " << e.what() << "\n";
        return 1;
    }
}
