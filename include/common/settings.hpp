/*
 * File: include/common/settings.hpp
 * Project: Tally Language Server
 * Purpose: Runtime settings from the editor's initialization options
 * Notes:
 *  - Recognized keys: api-url, api-key, metrics, debug, heartbeat-interval
 *  - Unknown keys are ignored; mistyped keys are ignored with a warning
 *  - SettingsStore publishes immutable snapshots; readers never block writers
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

constexpr int64_t kDefaultHeartbeatIntervalS = 120;
// One day. Keeps the interval representable in system_clock ticks.
constexpr int64_t kMaxHeartbeatIntervalS = 24 * 60 * 60;

struct Settings
{
    std::optional<std::string> api_key;
    std::optional<std::string> api_url;
    std::optional<bool> metrics;
    std::optional<bool> debug;
    std::optional<int64_t> heartbeat_interval_s;
    std::string plugin; // "<editor>/<version> tally-ls/<version>", empty if the editor sent no clientInfo

    std::chrono::seconds heartbeat_interval() const
    {
        const int64_t s = heartbeat_interval_s.value_or(kDefaultHeartbeatIntervalS);
        return std::chrono::seconds(std::clamp<int64_t>(s, 0, kMaxHeartbeatIntervalS));
    }
    bool debug_enabled() const { return debug.value_or(false); }
};

// Builds a fresh Settings from an options bundle. Problems are appended to
// `warnings` and the affected key keeps its default.
inline Settings settings_from_json(const nlohmann::json &opts, std::vector<std::string> &warnings)
{
    Settings s;
    if (opts.is_null())
        return s;
    if (!opts.is_object())
    {
        warnings.push_back("initialization options are not an object (" + std::string(opts.type_name()) + "), using defaults");
        return s;
    }

    auto get_string = [&](const char *key, std::optional<std::string> &out)
    {
        auto it = opts.find(key);
        if (it == opts.end() || it->is_null())
            return;
        if (!it->is_string())
        {
            warnings.push_back(std::string("option '") + key + "' must be a string, ignoring it");
            return;
        }
        out = it->get<std::string>();
    };
    auto get_bool = [&](const char *key, std::optional<bool> &out)
    {
        auto it = opts.find(key);
        if (it == opts.end() || it->is_null())
            return;
        if (!it->is_boolean())
        {
            warnings.push_back(std::string("option '") + key + "' must be a boolean, ignoring it");
            return;
        }
        out = it->get<bool>();
    };

    get_string("api-url", s.api_url);
    get_string("api-key", s.api_key);
    get_bool("metrics", s.metrics);
    get_bool("debug", s.debug);

    auto it = opts.find("heartbeat-interval");
    if (it != opts.end() && !it->is_null())
    {
        if (!it->is_number_integer())
            warnings.push_back("option 'heartbeat-interval' must be an integer number of seconds, ignoring it");
        else if (!it->is_number_unsigned() && it->get<int64_t>() < 0)
            warnings.push_back("option 'heartbeat-interval' must not be negative, ignoring it");
        else if (it->get<uint64_t>() > static_cast<uint64_t>(kMaxHeartbeatIntervalS))
            warnings.push_back("option 'heartbeat-interval' must be at most " + std::to_string(kMaxHeartbeatIntervalS) +
                               " seconds, ignoring it");
        else
            s.heartbeat_interval_s = it->get<int64_t>();
    }
    return s;
}

class SettingsStore
{
    std::shared_ptr<const Settings> current_ = std::make_shared<const Settings>();

public:
    std::shared_ptr<const Settings> load() const { return std::atomic_load(&current_); }
    void store(Settings s) { std::atomic_store(&current_, std::make_shared<const Settings>(std::move(s))); }
};
