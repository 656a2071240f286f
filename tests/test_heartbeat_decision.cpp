/*
 * File: tests/test_heartbeat_decision.cpp
 * Project: Tally Language Server
 * Purpose: Send/suppress rules and interval gating
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>
#include "common/activity.hpp"
#include "common/settings.hpp"
#include "tally_heartbeat.hpp"
#include "tally_state.hpp"

using namespace std::chrono_literals;
using Clock = std::chrono::system_clock;

namespace
{
const Clock::time_point T0 = Clock::time_point(std::chrono::seconds(1760000000));

ActivityEvent edit(const std::string &path, uint64_t line, uint64_t col, bool switched = false)
{
    ActivityEvent ev;
    ev.file_path = path;
    ev.line = line;
    ev.column = col;
    ev.file_switched = switched;
    return ev;
}

Settings with_interval(int64_t s)
{
    Settings st;
    st.heartbeat_interval_s = s;
    return st;
}
}

TEST_CASE("events without a position are always suppressed")
{
    Settings st;
    for (bool save : {false, true})
        for (bool switched : {false, true})
        {
            ActivityEvent ev;
            ev.file_path = "/src/a.txt";
            ev.is_save = save;
            ev.file_switched = switched;

            ev.line = 3;
            auto d = decide(ev, st, T0 - 1h, T0);
            REQUIRE_FALSE(d.send);
            REQUIRE(d.reason == SuppressReason::MissingPosition);

            ev.line.reset();
            ev.column = 3;
            d = decide(ev, st, T0 - 1h, T0);
            REQUIRE_FALSE(d.send);
            REQUIRE(d.reason == SuppressReason::MissingPosition);
        }
}

TEST_CASE("interval scenario: suppressed at +30s, sent at +61s")
{
    auto st = with_interval(60);
    FileTracker tracker(T0);
    tracker.note_active("/src/a.txt");

    auto d1 = decide(edit("/src/a.txt", 4, 2), st, tracker.last_sent(), T0 + 30s);
    REQUIRE_FALSE(d1.send);
    REQUIRE(d1.reason == SuppressReason::IntervalNotElapsed);
    REQUIRE(std::string(to_string(d1.reason)) == "interval not elapsed");

    auto d2 = decide(edit("/src/a.txt", 5, 0), st, tracker.last_sent(), T0 + 61s);
    REQUIRE(d2.send);
    REQUIRE(d2.update_timestamp);
    REQUIRE(d2.heartbeat.time == T0 + 61s);
    REQUIRE(d2.heartbeat.lineno == 5);
    REQUIRE(d2.heartbeat.cursorpos == 0);
    REQUIRE_FALSE(d2.heartbeat.is_write);

    tracker.mark_sent(d2.heartbeat.time);
    REQUIRE(tracker.last_sent() == T0 + 61s);
}

TEST_CASE("exactly one interval is not enough")
{
    auto st = with_interval(60);
    auto d = decide(edit("/a", 1, 1), st, T0, T0 + 60s);
    REQUIRE_FALSE(d.send);
}

TEST_CASE("default interval is two minutes")
{
    Settings st;
    REQUIRE_FALSE(decide(edit("/a", 1, 1), st, T0, T0 + 119s).send);
    REQUIRE_FALSE(decide(edit("/a", 1, 1), st, T0, T0 + 120s).send);
    REQUIRE(decide(edit("/a", 1, 1), st, T0, T0 + 121s).send);
}

TEST_CASE("file switch bypasses gating and leaves the clock alone")
{
    auto st = with_interval(60);
    auto d = decide(edit("/src/b.txt", 9, 9, true), st, T0, T0 + 1s);
    REQUIRE(d.send);
    REQUIRE_FALSE(d.update_timestamp);
    REQUIRE(d.heartbeat.entity == "/src/b.txt");
}

TEST_CASE("save with a cached position sends the cached position")
{
    auto st = with_interval(60);
    FileCache cache;
    cache.record("/src/a.txt", 41, 17);

    ActivityEvent ev;
    ev.file_path = "/src/a.txt";
    ev.is_save = true;
    auto entry = cache.lookup(ev.file_path);
    REQUIRE(entry);
    ev.line = entry->line;
    ev.column = entry->column;

    auto d = decide(ev, st, T0, T0 + 2s);
    REQUIRE(d.send);
    REQUIRE_FALSE(d.update_timestamp);
    REQUIRE(d.heartbeat.is_write);
    REQUIRE(d.heartbeat.lineno == 41);
    REQUIRE(d.heartbeat.cursorpos == 17);

    // a save after the interval still does not move the clock
    auto late = decide(ev, st, T0, T0 + 1h);
    REQUIRE(late.send);
    REQUIRE_FALSE(late.update_timestamp);
}

TEST_CASE("save of a file with no cache entry is suppressed")
{
    auto st = with_interval(60);
    FileCache cache;
    ActivityEvent ev;
    ev.file_path = "a.txt";
    ev.is_save = true;
    if (auto entry = cache.lookup(ev.file_path))
    {
        ev.line = entry->line;
        ev.column = entry->column;
    }
    auto d = decide(ev, st, T0, T0 + 5s);
    REQUIRE_FALSE(d.send);
    REQUIRE(d.reason == SuppressReason::MissingPosition);
}

TEST_CASE("steady editing on one file is rate limited")
{
    auto st = with_interval(60);
    FileTracker tracker(T0 - 1h);
    REQUIRE(tracker.note_active("/src/a.txt"));

    int sent = 0;
    for (int s = 0; s <= 180; s += 5)
    {
        auto now = T0 + std::chrono::seconds(s);
        auto d = decide(edit("/src/a.txt", s, 1, false), st, tracker.last_sent(), now);
        if (d.send)
        {
            ++sent;
            REQUIRE(d.update_timestamp);
            tracker.mark_sent(now);
        }
    }
    // t=0 (baseline an hour old), t=65, t=130
    REQUIRE(sent == 3);
    REQUIRE(tracker.last_sent() == T0 + 130s);
}

TEST_CASE("an enormous interval does not wrap around")
{
    auto st = with_interval(10000000000);
    auto d = decide(edit("/src/a.txt", 1, 1), st, T0 - 1s, T0);
    REQUIRE_FALSE(d.send);
    REQUIRE(d.reason == SuppressReason::IntervalNotElapsed);

    // capped at one day
    REQUIRE(decide(edit("/src/a.txt", 1, 1), st, T0 - 25h, T0).send);
}

TEST_CASE("language hint is carried into the heartbeat")
{
    Settings st;
    auto ev = edit("/src/a.rs", 1, 1, true);
    REQUIRE_FALSE(decide(ev, st, T0, T0).heartbeat.language);
    ev.language_hint = "Rust";
    REQUIRE(decide(ev, st, T0, T0).heartbeat.language == std::optional<std::string>("Rust"));
}
