/*
 * File: tests/fake_players.hpp
 * Project: DuoSync
 * Purpose: Scripted PlayerClient and scratch data directory for tests
 * Notes:
 *  - Records sends, queries and delays in one ordered event list
 *  - A status script repeats its last entry once exhausted
 * Last updated: 2026-10-18
 */

#pragma once
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "action_log.hpp"
#include "path_store.hpp"
#include "player_client.hpp"
#include "sync_controller.hpp"

struct Event
{
    enum class Kind { Send, Query, Delay };
    Kind kind;
    Role role = Role::Master;
    PlayerCommand cmd{};
    std::chrono::milliseconds delay{0};
};

inline PlayerStatus make_status(PlayState s, double t, bool fullscreen = false)
{
    PlayerStatus st;
    st.state = s;
    st.elapsed = t;
    st.time_known = true;
    st.fullscreen = fullscreen;
    return st;
}

class FakePlayers : public PlayerClient
{
    std::mutex m_;
    std::map<Role, std::deque<std::optional<PlayerStatus>>> script_;
    std::vector<Event> events_;
    bool fail_sends_ = false;

public:
    void script(Role r, std::vector<std::optional<PlayerStatus>> seq)
    {
        std::scoped_lock lk(m_);
        script_[r] = std::deque<std::optional<PlayerStatus>>(seq.begin(), seq.end());
    }

    void fail_sends(bool on) { fail_sends_ = on; }

    SendResult send(const Participant &p, const PlayerCommand &cmd) override
    {
        std::scoped_lock lk(m_);
        events_.push_back({Event::Kind::Send, p.role, cmd, {}});
        return fail_sends_ ? SendResult::TransportFailed : SendResult::Sent;
    }

    std::optional<PlayerStatus> query(const Participant &p) override
    {
        std::scoped_lock lk(m_);
        events_.push_back({Event::Kind::Query, p.role, {}, {}});
        auto &q = script_[p.role];
        if (q.empty())
            return std::nullopt;
        auto s = q.front();
        if (q.size() > 1)
            q.pop_front();
        return s;
    }

    DelayFn delay_fn()
    {
        return [this](std::chrono::milliseconds d)
        {
            std::scoped_lock lk(m_);
            events_.push_back({Event::Kind::Delay, Role::Master, {}, d});
        };
    }

    // sends and delays in issue order; queries left out since the pair is polled concurrently
    std::vector<Event> timeline()
    {
        std::scoped_lock lk(m_);
        std::vector<Event> out;
        for (const auto &e : events_)
            if (e.kind != Event::Kind::Query)
                out.push_back(e);
        return out;
    }

    std::vector<Event> sends()
    {
        std::scoped_lock lk(m_);
        std::vector<Event> out;
        for (const auto &e : events_)
            if (e.kind == Event::Kind::Send)
                out.push_back(e);
        return out;
    }

    std::vector<PlayerCommand> sent_to(Role r)
    {
        std::vector<PlayerCommand> out;
        for (const auto &e : sends())
            if (e.role == r)
                out.push_back(e.cmd);
        return out;
    }

    size_t queries(Role r)
    {
        std::scoped_lock lk(m_);
        size_t n = 0;
        for (const auto &e : events_)
            if (e.kind == Event::Kind::Query && e.role == r)
                ++n;
        return n;
    }
};

// Timeline matchers
inline bool is_send(const Event &e, Role r, const PlayerCommand &c)
{
    return e.kind == Event::Kind::Send && e.role == r && e.cmd == c;
}

inline bool is_delay(const Event &e, std::chrono::milliseconds d)
{
    return e.kind == Event::Kind::Delay && e.delay == d;
}

// Unique scratch directory, removed on destruction.
struct TempDir
{
    std::filesystem::path path;

    TempDir()
    {
        static std::atomic<int> n{0};
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
               ("duosync_test_" + std::to_string(rd()) + "_" + std::to_string(n++));
        std::filesystem::create_directories(path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;
};

// Everything a controller needs, wired to the fake players.
struct Rig
{
    TempDir dir;
    ActionLog log{dir.path};
    PathStore paths{dir.path};
    FakePlayers players;
    SyncPolicy policy{};

    ControlContext context(MediaSelection sel = {"/media/master.mp4", "/media/slave.mp4"})
    {
        return ControlContext{players,
                              Participant{Role::Master, "http://master:8080", "pw"},
                              Participant{Role::Slave, "http://slave:8080", "pw"},
                              paths,
                              log,
                              policy,
                              players.delay_fn(),
                              std::move(sel)};
    }
};
