/*
 * File: src/status_poller.hpp
 * Project: DuoSync
 * Purpose: Paired status queries for master and slave
 * Notes:
 *  - The two queries run concurrently; results are never cached
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <functional>
#include <future>
#include <optional>

#include "common/player_status.hpp"
#include "player_client.hpp"

using DelayFn = std::function<void(std::chrono::milliseconds)>;

struct StatusPair
{
    std::optional<PlayerStatus> master;
    std::optional<PlayerStatus> slave;

    const std::optional<PlayerStatus> &of(Role r) const { return r == Role::Master ? master : slave; }
    std::optional<PlayerStatus> &of(Role r) { return r == Role::Master ? master : slave; }

    // Reachable in the Sync sense: answered and reported a time.
    bool timed(Role r) const
    {
        const auto &s = of(r);
        return s && s->time_known;
    }
};

inline StatusPair poll_both(PlayerClient &players, const Participant &master, const Participant &slave)
{
    auto slave_f = std::async(std::launch::async, [&players, &slave]
                              { return players.query(slave); });
    StatusPair out;
    out.master = players.query(master);
    out.slave = slave_f.get();
    return out;
}

// Re-polls both until each reported a time or the attempts run out.
// Returns the last pair seen; reachability is judged per participant.
inline StatusPair poll_until_timed(PlayerClient &players, const Participant &master, const Participant &slave,
                                   int attempts, std::chrono::milliseconds gap, const DelayFn &delay)
{
    StatusPair st;
    for (int i = 0; i < attempts; ++i)
    {
        st = poll_both(players, master, slave);
        if (st.timed(Role::Master) && st.timed(Role::Slave))
            break;
        if (i + 1 < attempts)
            delay(gap);
    }
    return st;
}
