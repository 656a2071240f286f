/*
 * File: tests/test_file_cache.cpp
 * Project: Tally Language Server
 * Purpose: Per-file cursor cache
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>
#include <atomic>
#include <thread>
#include "common/activity.hpp"

TEST_CASE("file cache roundtrip")
{
    FileCache c;
    c.record("/src/a.txt", 12, 7);
    auto e = c.lookup("/src/a.txt");
    REQUIRE(e.has_value());
    REQUIRE(e->line == 12);
    REQUIRE(e->column == 7);
}

TEST_CASE("file cache lookup of an unknown path is empty")
{
    FileCache c;
    REQUIRE_FALSE(c.lookup("/never/recorded").has_value());
    c.record("/src/a.txt", 1, 1);
    REQUIRE_FALSE(c.lookup("/src/A.txt").has_value());
}

TEST_CASE("file cache overwrites and keeps one entry per path")
{
    FileCache c;
    c.record("/src/a.txt", 1, 2);
    c.record("/src/a.txt", 30, 4);
    REQUIRE(c.size() == 1);
    auto e = c.lookup("/src/a.txt");
    REQUIRE(e->line == 30);
    REQUIRE(e->column == 4);
    // lookup does not consume
    REQUIRE(c.lookup("/src/a.txt").has_value());
}

TEST_CASE("concurrent updates to different files do not mix")
{
    FileCache c;
    c.record("a.txt", 5, 5);
    std::thread ta([&]
                   {
        for (uint64_t i = 0; i < 2000; ++i)
            c.record("a.txt", i, i + 1); });
    std::thread tb([&]
                   {
        for (uint64_t i = 0; i < 2000; ++i)
            c.record("b.txt", 10000 + i, 20000 + i); });
    ta.join();
    tb.join();
    REQUIRE(c.size() == 2);
    auto a = c.lookup("a.txt");
    auto b = c.lookup("b.txt");
    REQUIRE(a->line == 1999);
    REQUIRE(a->column == 2000);
    REQUIRE(b->line == 11999);
    REQUIRE(b->column == 21999);
}

TEST_CASE("concurrent readers never see a torn entry")
{
    FileCache c;
    c.record("a.txt", 0, 0);
    std::atomic<bool> torn{false};
    std::thread w([&]
                  {
        for (uint64_t i = 1; i < 5000; ++i)
            c.record("a.txt", i, i); });
    std::thread r([&]
                  {
        for (int i = 0; i < 5000; ++i)
        {
            auto e = c.lookup("a.txt");
            if (e && e->line != e->column)
                torn = true;
        } });
    w.join();
    r.join();
    REQUIRE_FALSE(torn);
}
