/*
 * File: src/tally_heartbeat.hpp
 * Project: Tally Language Server
 * Purpose: Send-or-suppress decision for one activity event
 * Notes:
 *  - Saves and file switches bypass interval gating and never move the gating clock
 *  - decide() is pure; callers apply update_timestamp once the agent exits
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <string>
#include "common/activity.hpp"
#include "common/settings.hpp"

enum class SuppressReason
{
    MissingPosition,
    IntervalNotElapsed,
    IntervalInFlight,
};

inline const char *to_string(SuppressReason r)
{
    switch (r)
    {
    case SuppressReason::MissingPosition:
        return "missing position";
    case SuppressReason::IntervalNotElapsed:
        return "interval not elapsed";
    case SuppressReason::IntervalInFlight:
        return "interval heartbeat in flight";
    }
    return "unknown";
}

struct Decision
{
    bool send = false;
    SuppressReason reason = SuppressReason::MissingPosition; // meaningful only when !send
    bool update_timestamp = false;
    Heartbeat heartbeat; // meaningful only when send

    static Decision suppress(SuppressReason r)
    {
        Decision d;
        d.reason = r;
        return d;
    }
};

inline Decision decide(const ActivityEvent &ev,
                       const Settings &settings,
                       std::chrono::system_clock::time_point last_sent,
                       std::chrono::system_clock::time_point now)
{
    if (!ev.line || !ev.column)
        return Decision::suppress(SuppressReason::MissingPosition);

    const auto elapsed = now - last_sent;
    const bool should_send = ev.is_save || ev.file_switched || elapsed > settings.heartbeat_interval();
    if (!should_send)
        return Decision::suppress(SuppressReason::IntervalNotElapsed);

    Decision d;
    d.send = true;
    d.update_timestamp = !ev.is_save && !ev.file_switched;
    d.heartbeat.time = now;
    d.heartbeat.entity = ev.file_path;
    d.heartbeat.is_write = ev.is_save;
    d.heartbeat.language = ev.language_hint;
    d.heartbeat.lineno = *ev.line;
    d.heartbeat.cursorpos = *ev.column;
    return d;
}
