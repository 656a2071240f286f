/*
 * File: src/tally_lsp.hpp
 * Project: Tally Language Server
 * Purpose: stdio JSON-RPC framing, editor notification routing, heartbeat pipeline
 * Notes:
 *  - Only the lifecycle messages and didChange/didSave are understood
 *  - Messages are read and routed one at a time on a strand (arrival order)
 *  - Decision + dispatch run as independent tasks on the io_context
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

#include "common/activity.hpp"
#include "common/settings.hpp"
#include "common/uri_path.hpp"
#include "tally_dispatch.hpp"
#include "tally_heartbeat.hpp"
#include "tally_state.hpp"

#ifndef TALLY_VERSION
#define TALLY_VERSION "0.0.0"
#endif

// -------- framing --------

// Invalid UTF-8 (e.g. from a percent-decoded path) is replaced, not thrown.
inline std::string frame_message(const nlohmann::json &msg)
{
    const std::string body = msg.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

// Header names are case-insensitive; anything but Content-Length is ignored.
inline std::optional<size_t> parse_content_length(const std::string &headers)
{
    size_t pos = 0;
    while (pos < headers.size())
    {
        auto eol = headers.find("\r\n", pos);
        if (eol == std::string::npos)
            eol = headers.size();
        const std::string line = headers.substr(pos, eol - pos);
        pos = eol + 2;

        auto colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        std::string name = line.substr(0, colon);
        for (auto &c : name)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (name != "content-length")
            continue;
        try
        {
            size_t used = 0;
            const std::string value = line.substr(colon + 1);
            auto n = std::stoull(value, &used);
            if (value.find_first_not_of(" \t", used) != std::string::npos)
                return std::nullopt;
            return static_cast<size_t>(n);
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

// -------- client channel --------

enum class MessageType : int
{
    Error = 1,
    Warning = 2,
    Info = 3,
    Log = 4,
};

namespace rpc_error
{
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InternalError = -32603;
constexpr int ServerNotInitialized = -32002;
}

// Everything we send to the editor goes through here. `write` receives whole
// frames and is called under a lock.
class LspClient
{
    std::mutex send_mtx_;
    std::function<void(const std::string &)> write_;
    const SettingsStore &settings_;

public:
    LspClient(std::function<void(const std::string &)> write, const SettingsStore &settings)
        : write_(std::move(write)), settings_(settings) {}

    void send(const nlohmann::json &msg)
    {
        const std::string frame = frame_message(msg);
        std::scoped_lock lk(send_mtx_);
        write_(frame);
    }

    void notify(const std::string &method, nlohmann::json params)
    {
        send(nlohmann::json{{"jsonrpc", "2.0"}, {"method", method}, {"params", std::move(params)}});
    }

    void respond(const nlohmann::json &id, nlohmann::json result)
    {
        send(nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}});
    }

    void respond_error(const nlohmann::json &id, int code, const std::string &message)
    {
        send(nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}});
    }

    // Log-level messages are only forwarded with `debug` on. Warnings and
    // errors are mirrored to stderr.
    void log_message(MessageType type, const std::string &text)
    {
        if (type == MessageType::Log && !settings_.load()->debug_enabled())
            return;
        if (type == MessageType::Error)
            std::cerr << "ERROR: " << text << "\n";
        else if (type == MessageType::Warning)
            std::cerr << "WARN: " << text << "\n";
        notify("window/logMessage", {{"type", static_cast<int>(type)}, {"message", text}});
    }
};

// -------- session --------

inline std::string make_plugin_id(const nlohmann::json &client_info)
{
    if (!client_info.is_object())
        return std::string();
    std::string plugin = client_info.value("name", std::string());
    if (plugin.empty())
        return plugin;
    auto v = client_info.find("version");
    if (v != client_info.end() && v->is_string())
        plugin += "/" + v->get<std::string>();
    plugin += " tally-ls/" TALLY_VERSION;
    return plugin;
}

class LspSession
{
    TallyState &state_;
    LspClient &client_;
    Dispatcher &dispatcher_;
    std::function<void(int)> on_exit_;
    bool initialized_ = false;
    bool shutdown_ = false;

public:
    LspSession(TallyState &st, LspClient &client, Dispatcher &dispatcher, std::function<void(int)> on_exit)
        : state_(st), client_(client), dispatcher_(dispatcher), on_exit_(std::move(on_exit)) {}

    bool shutdown_requested() const { return shutdown_; }

    // Called once per incoming message, in arrival order.
    void handle(const nlohmann::json &msg)
    {
        using nlohmann::json;

        if (!msg.is_object() || !msg.contains("method") || !msg["method"].is_string())
            return; // responses to our own requests (we send none) or junk

        const std::string method = msg["method"].get<std::string>();
        json params = msg.value("params", json::object());
        if (!params.is_object())
            params = json::object();
        const bool is_request = msg.contains("id");
        const json id = is_request ? msg["id"] : json();

        if (method == "exit")
        {
            if (on_exit_)
                on_exit_(shutdown_ ? 0 : 1);
            return;
        }

        if (is_request)
        {
            try
            {
                handle_request(method, id, params);
            }
            catch (const std::exception &e)
            {
                client_.respond_error(id, rpc_error::InternalError, method + " failed: " + e.what());
            }
            return;
        }

        if (!initialized_ || shutdown_)
            return;

        if (method == "initialized")
        {
            client_.log_message(MessageType::Info, "Tally language server initialized");
            client_.log_message(MessageType::Info,
                                "Only editing events with a line and cursor position are tracked.");
        }
        else if (method == "textDocument/didChange")
            did_change(params);
        else if (method == "textDocument/didSave")
            did_save(params);
        // everything else, $/ notifications included, is ignored
    }

    void handle_request(const std::string &method, const nlohmann::json &id, const nlohmann::json &params)
    {
        if (shutdown_)
            return client_.respond_error(id, rpc_error::InvalidRequest, "server is shutting down");
        if (method == "initialize")
            return client_.respond(id, initialize(params));
        if (!initialized_)
            return client_.respond_error(id, rpc_error::ServerNotInitialized, "server not initialized");
        if (method == "shutdown")
        {
            shutdown_ = true;
            return client_.respond(id, nullptr);
        }
        return client_.respond_error(id, rpc_error::MethodNotFound, "method not found: " + method);
    }

    nlohmann::json initialize(const nlohmann::json &params)
    {
        using nlohmann::json;

        std::vector<std::string> warnings;
        Settings s = settings_from_json(params.value("initializationOptions", json()), warnings);
        s.plugin = make_plugin_id(params.value("clientInfo", json()));
        state_.settings.store(std::move(s));
        initialized_ = true;

        for (const auto &w : warnings)
            client_.log_message(MessageType::Warning, "Tally language server: " + w);

        return json{
            {"serverInfo", {{"name", "tally-ls"}, {"version", TALLY_VERSION}}},
            {"capabilities",
             {{"textDocumentSync",
               {{"openClose", false}, {"change", 2}, {"save", {{"includeText", false}}}}}}}};
    }

    void did_change(const nlohmann::json &params)
    {
        const std::string path = document_path(params);
        if (path.empty())
            return;

        ActivityEvent ev;
        ev.file_path = path;
        auto changes = params.find("contentChanges");
        if (changes != params.end() && changes->is_array() && !changes->empty())
        {
            const auto &first = (*changes)[0];
            auto range = first.find("range");
            if (range != first.end() && range->is_object())
            {
                const auto start = range->value("start", nlohmann::json::object());
                auto line = start.find("line");
                auto character = start.find("character");
                ev.line = position_field(start, "line");
                ev.column = position_field(start, "character");
            }
        }

        ev.file_switched = state_.tracker.note_active(path);
        state_.files.record(path, ev.line.value_or(0), ev.column.value_or(0));
        submit(std::move(ev));
    }

    void did_save(const nlohmann::json &params)
    {
        const std::string path = document_path(params);
        if (path.empty())
            return;
        client_.log_message(MessageType::Info, "Tally language server: file saved: " + path);

        ActivityEvent ev;
        ev.file_path = path;
        ev.is_save = true;
        if (auto entry = state_.files.lookup(path))
        {
            ev.line = entry->line;
            ev.column = entry->column;
        }
        state_.tracker.note_active(path);
        submit(std::move(ev));
    }

    // Runs the decision and, if it says so, the agent, off the read strand.
    void submit(ActivityEvent ev)
    {
        if (state_.io)
            boost::asio::post(*state_.io, [this, ev = std::move(ev)]()
                              { process(ev); });
        else
            process(ev);
    }

    void process(const ActivityEvent &ev)
    {
        try
        {
            send_heartbeat(ev);
        }
        catch (const std::exception &e)
        {
            client_.log_message(MessageType::Error,
                                "Tally language server: dropping event for " + ev.file_path + ": " + e.what());
        }
    }

private:
    static std::string document_path(const nlohmann::json &params)
    {
        auto doc = params.find("textDocument");
        if (doc == params.end() || !doc->is_object())
            return std::string();
        return uri_to_path(doc->value("uri", std::string()));
    }

    // Non-negative integer only; json built from signed ints is accepted too.
    static std::optional<uint64_t> position_field(const nlohmann::json &pos, const char *key)
    {
        auto it = pos.find(key);
        if (it == pos.end() || !it->is_number_integer())
            return std::nullopt;
        if (it->is_number_unsigned())
            return it->get<uint64_t>();
        const auto v = it->get<int64_t>();
        if (v < 0)
            return std::nullopt;
        return static_cast<uint64_t>(v);
    }

    void send_heartbeat(const ActivityEvent &ev)
    {
        const auto settings = state_.settings.load();
        const auto last_sent = state_.tracker.last_sent();
        const auto d = decide(ev, *settings, last_sent, std::chrono::system_clock::now());

        if (!d.send)
        {
            if (d.reason == SuppressReason::MissingPosition)
                client_.log_message(MessageType::Info,
                                    "Tally language server: no cursor position or line number info for file: " +
                                        ev.file_path + ", ignoring event");
            else
                client_.log_message(MessageType::Log,
                                    "Tally language server: skipping heartbeat for file: " + ev.file_path +
                                        " (" + to_string(d.reason) + "), last sent at " + epoch_seconds(last_sent));
            return;
        }

        const bool update = d.update_timestamp;
        if (update && !state_.tracker.try_begin_interval_dispatch(last_sent))
        {
            const auto why = state_.tracker.interval_in_flight() ? SuppressReason::IntervalInFlight
                                                                 : SuppressReason::IntervalNotElapsed;
            client_.log_message(MessageType::Log,
                                "Tally language server: skipping heartbeat for file: " + ev.file_path + " (" +
                                    to_string(why) + ")");
            return;
        }

        // The file is read only after the slot is ours.
        std::vector<std::string> args;
        std::string cmd;
        try
        {
            args = heartbeat_args(d.heartbeat, *settings, count_lines(d.heartbeat.entity));
            cmd = describe_command(dispatcher_.executable(), args);
        }
        catch (...)
        {
            if (update)
                state_.tracker.abandon_interval_dispatch();
            throw;
        }

        client_.log_message(MessageType::Log, "Tally language server: event " + event_to_json(ev).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        client_.log_message(MessageType::Log, "Tally command: " + cmd);

        const auto sent_at = d.heartbeat.time;
        dispatcher_.dispatch(args, [this, update, sent_at, cmd](bool ok, const std::string &why)
                             {
            if (!ok)
                client_.log_message(MessageType::Log,
                                    "Tally language server: heartbeat failed: " + why + ", command: " + cmd);
            if (update)
                state_.tracker.finish_interval_dispatch(sent_at); });
    }
};

// -------- stdio transport --------

// Private copy of a standard descriptor that agent processes don't inherit.
inline int dup_cloexec(int fd)
{
    int copy = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
    if (copy < 0)
        throw std::runtime_error("dup of fd " + std::to_string(fd) + " failed");
    return copy;
}

class StdioServer
{
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::posix::stream_descriptor in_;
    boost::asio::streambuf buf_;
    LspSession &session_;
    std::function<void()> on_closed_;

public:
    StdioServer(boost::asio::io_context &ioc, int fd, LspSession &session, std::function<void()> on_closed)
        : strand_(boost::asio::make_strand(ioc)), in_(strand_, dup_cloexec(fd)), session_(session),
          on_closed_(std::move(on_closed)) {}

    void start()
    {
        boost::asio::dispatch(strand_, [this]()
                              { do_read_header(); });
    }

private:
    void do_read_header()
    {
        boost::asio::async_read_until(in_, buf_, "\r\n\r\n", [this](boost::system::error_code ec, std::size_t n)
                                      {
            if (ec)
                return closed(ec);
            std::string headers(boost::asio::buffers_begin(buf_.data()),
                                boost::asio::buffers_begin(buf_.data()) + n);
            buf_.consume(n);
            auto len = parse_content_length(headers);
            if (!len)
            {
                std::cerr << "WARN: frame without a usable Content-Length header, skipping\n";
                return do_read_header();
            }
            do_read_body(*len); });
    }

    void do_read_body(size_t len)
    {
        if (buf_.size() >= len)
            return on_body(len);
        boost::asio::async_read(in_, buf_, boost::asio::transfer_exactly(len - buf_.size()),
                                [this, len](boost::system::error_code ec, std::size_t)
                                {
            if (ec)
                return closed(ec);
            on_body(len); });
    }

    void on_body(size_t len)
    {
        std::string body(boost::asio::buffers_begin(buf_.data()),
                         boost::asio::buffers_begin(buf_.data()) + len);
        buf_.consume(len);

        auto msg = nlohmann::json::parse(body, nullptr, false);
        if (msg.is_discarded())
            std::cerr << "WARN: ignoring message that is not valid JSON (" << len << " bytes)\n";
        else
        {
            try
            {
                session_.handle(msg);
            }
            catch (const std::exception &e)
            {
                std::cerr << "ERROR: failed to handle message: " << e.what() << "\n";
            }
        }
        do_read_header();
    }

    void closed(const boost::system::error_code &ec)
    {
        if (ec != boost::asio::error::eof)
            std::cerr << "WARN: stdin read failed: " << ec.message() << "\n";
        if (on_closed_)
            on_closed_();
    }
};
