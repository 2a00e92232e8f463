/*
 * File: include/common/player_status.hpp
 * Project: DuoSync
 * Purpose: Participant roles and the player status document
 * Notes:
 *  - Status is parsed from VLC's /requests/status.json
 *  - Missing fields fall back to time=0, fullscreen=false, state=unknown
 * Last updated: 2026-10-18
 */

#pragma once
#include <cmath>
#include <cstdlib>
#include <string>
#include <nlohmann/json.hpp>


enum class Role { Master, Slave };

enum class PlayState { Playing, Paused, Stopped, Unknown };


inline const char *role_name(Role r)
{
    return r == Role::Master ? "master" : "slave";
}

// Capitalised form used in operator-facing messages ("Master VLC is ...").
inline const char *role_label(Role r)
{
    return r == Role::Master ? "Master" : "Slave";
}

inline const char *state_name(PlayState s)
{
    switch (s)
    {
    case PlayState::Playing:
        return "playing";
    case PlayState::Paused:
        return "paused";
    case PlayState::Stopped:
        return "stopped";
    default:
        return "unknown";
    }
}

inline PlayState parse_state(const std::string &s)
{
    if (s == "playing")
        return PlayState::Playing;
    if (s == "paused")
        return PlayState::Paused;
    if (s == "stopped")
        return PlayState::Stopped;
    return PlayState::Unknown;
}


struct PlayerStatus {
PlayState state = PlayState::Unknown;
double elapsed = 0.0;     // seconds
bool time_known = false;  // the document carried a usable "time" field
bool fullscreen = false;
double length = 0.0;      // seconds, 0 when not reported
double rate = 1.0;
};


namespace detail
{
    // Numbers arrive as JSON numbers or, from some VLC builds, as strings.
    inline bool coerce_number(const nlohmann::json &j, double &out)
    {
        if (j.is_number())
        {
            out = j.get<double>();
            return std::isfinite(out);
        }
        if (j.is_string())
        {
            const std::string &s = j.get_ref<const std::string &>();
            if (s.empty())
                return false;
            char *end = nullptr;
            double v = std::strtod(s.c_str(), &end);
            if (end == s.c_str() || *end != '\0' || !std::isfinite(v))
                return false;
            out = v;
            return true;
        }
        return false;
    }
}


inline PlayerStatus status_from_json(const nlohmann::json &j)
{
    PlayerStatus st;
    if (!j.is_object())
        return st;

    if (j.contains("state") && j["state"].is_string())
        st.state = parse_state(j["state"].get<std::string>());

    double t = 0.0;
    if (j.contains("time") && detail::coerce_number(j["time"], t))
    {
        st.elapsed = t < 0.0 ? 0.0 : t;
        st.time_known = true;
    }

    if (j.contains("fullscreen"))
    {
        const auto &fs = j["fullscreen"];
        if (fs.is_boolean())
            st.fullscreen = fs.get<bool>();
        else if (fs.is_number())
            st.fullscreen = fs.get<double>() != 0.0;
    }

    double v = 0.0;
    if (j.contains("length") && detail::coerce_number(j["length"], v))
        st.length = v;
    if (j.contains("rate") && detail::coerce_number(j["rate"], v))
        st.rate = v;
    return st;
}

inline nlohmann::json status_to_json(const PlayerStatus &st)
{
    using nlohmann::json;
    return json{
        {"state", state_name(st.state)},
        {"time", st.time_known ? json(st.elapsed) : json(nullptr)},
        {"fullscreen", st.fullscreen},
        {"length", st.length},
        {"rate", st.rate}};
}
