/*
 * File: include/common/activity.hpp
 * Project: Tally Language Server
 * Purpose: Activity events, heartbeat payloads and the per-file cursor cache
 * Notes:
 *  - Cache keys are normalized paths (see common/uri_path.hpp)
 *  - FileCache is shared by every notification handler; all access is locked
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

// One qualifying editor notification, after path normalization.
struct ActivityEvent
{
    std::string file_path;
    bool is_save = false;
    std::optional<std::string> language_hint;
    std::optional<uint64_t> line;
    std::optional<uint64_t> column;
    bool file_switched = false;
};

struct CacheEntry
{
    uint64_t line{0};
    uint64_t column{0};
};

// What the dispatcher turns into an agent invocation.
struct Heartbeat
{
    std::chrono::system_clock::time_point time;
    std::string entity;
    bool is_write = false;
    std::optional<std::string> language;
    uint64_t lineno{0};
    uint64_t cursorpos{0};
};

inline nlohmann::json event_to_json(const ActivityEvent &ev)
{
    using nlohmann::json;
    json j{
        {"file", ev.file_path},
        {"is_save", ev.is_save},
        {"file_switched", ev.file_switched}};
    j["language"] = ev.language_hint ? json(*ev.language_hint) : json();
    j["line"] = ev.line ? json(*ev.line) : json();
    j["column"] = ev.column ? json(*ev.column) : json();
    return j;
}

class FileCache
{
    mutable std::mutex m_;
    std::unordered_map<std::string, CacheEntry> entries_;

public:
    void record(const std::string &path, uint64_t line, uint64_t column)
    {
        std::scoped_lock lk(m_);
        entries_[path] = CacheEntry{line, column};
    }

    std::optional<CacheEntry> lookup(const std::string &path) const
    {
        std::scoped_lock lk(m_);
        auto it = entries_.find(path);
        if (it == entries_.end())
            return std::nullopt;
        return it->second;
    }

    size_t size() const
    {
        std::scoped_lock lk(m_);
        return entries_.size();
    }
};
