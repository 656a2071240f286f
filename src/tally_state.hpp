/*
 * File: src/tally_state.hpp
 * Project: Tally Language Server
 * Purpose: Process-wide shared state: settings, file cache, current-file tracker
 * Notes:
 *  - Cache and tracker have separate locks; nothing holds both
 *  - Nothing here survives a restart
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <mutex>
#include <string>
#include <boost/asio.hpp>
#include "common/activity.hpp"
#include "common/settings.hpp"

class FileTracker
{
    mutable std::mutex m_;
    std::string active_path_;
    std::chrono::system_clock::time_point last_sent_;
    bool interval_in_flight_ = false;

public:
    explicit FileTracker(std::chrono::system_clock::time_point start = std::chrono::system_clock::now())
        : last_sent_(start) {}

    // Returns true when `path` differs from the previously active file.
    bool note_active(const std::string &path)
    {
        std::scoped_lock lk(m_);
        if (path == active_path_)
            return false;
        active_path_ = path;
        return true;
    }

    std::string active() const
    {
        std::scoped_lock lk(m_);
        return active_path_;
    }

    std::chrono::system_clock::time_point last_sent() const
    {
        std::scoped_lock lk(m_);
        return last_sent_;
    }

    // Never moves the clock backwards.
    void mark_sent(std::chrono::system_clock::time_point t)
    {
        std::scoped_lock lk(m_);
        last_sent_ = std::max(last_sent_, t);
    }

    // At most one interval-gated heartbeat is outstanding at a time. The claim
    // also fails when the clock has moved since the caller read `seen_last_sent`.
    bool try_begin_interval_dispatch(std::chrono::system_clock::time_point seen_last_sent)
    {
        std::scoped_lock lk(m_);
        if (interval_in_flight_ || last_sent_ != seen_last_sent)
            return false;
        interval_in_flight_ = true;
        return true;
    }

    // Called once the agent has exited, whatever its exit status.
    void finish_interval_dispatch(std::chrono::system_clock::time_point sent_at)
    {
        std::scoped_lock lk(m_);
        interval_in_flight_ = false;
        last_sent_ = std::max(last_sent_, sent_at);
    }

    // Releases a claim whose agent was never started.
    void abandon_interval_dispatch()
    {
        std::scoped_lock lk(m_);
        interval_in_flight_ = false;
    }

    bool interval_in_flight() const
    {
        std::scoped_lock lk(m_);
        return interval_in_flight_;
    }
};

struct TallyState
{
    SettingsStore settings;
    FileCache files;
    FileTracker tracker;
    std::string agent_path{"wakatime-cli"};
    boost::asio::io_context *io = nullptr;

    // `start` seeds the gating clock.
    explicit TallyState(std::chrono::system_clock::time_point start = std::chrono::system_clock::now())
        : tracker(start) {}
};
