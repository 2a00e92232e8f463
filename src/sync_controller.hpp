/*
 * File: src/sync_controller.hpp
 * Project: DuoSync
 * Purpose: One handler per control intent, driving both players in lockstep
 * Notes:
 *  - Each intent is a self-contained procedure over freshly polled status
 *  - Commands go master first, then slave; neither blocks the other
 *  - Settle windows are explicit calls to ControlContext::delay
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>

#include "action_log.hpp"
#include "common/player_status.hpp"
#include "path_store.hpp"
#include "player_client.hpp"
#include "status_poller.hpp"

// Intent-level failure. The message goes back to the caller verbatim.
struct ControlError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct SyncPolicy
{
    double drift_tolerance_s = 0.5;   // drift at or below this is left alone
    double lead_compensation_s = 1.0; // added to the leader's time when seeking the laggard
    int status_attempts = 3;
    double skip_step_s = 10.0;

    std::chrono::milliseconds settle_delay{1000};
    std::chrono::milliseconds enqueue_delay{300};
    std::chrono::milliseconds fullscreen_delay{300};
    std::chrono::milliseconds rate_delay{200};
    std::chrono::milliseconds retry_delay{200};
    std::chrono::milliseconds reload_delay{350};
};

inline void sleep_delay(std::chrono::milliseconds d)
{
    std::this_thread::sleep_for(d);
}

struct ControlContext
{
    PlayerClient &players;
    Participant master;
    Participant slave;
    PathStore &paths;
    ActionLog &log;
    SyncPolicy policy{};
    DelayFn delay = sleep_delay;
    MediaSelection selection{};

    const Participant &participant(Role r) const { return r == Role::Master ? master : slave; }
};

// -------- intents --------

struct PlayIntent { static constexpr const char *name = "play"; };
struct PauseIntent { static constexpr const char *name = "pause"; };
struct StopIntent { static constexpr const char *name = "stop"; };
struct SeekIntent { static constexpr const char *name = "seek"; double seconds; };
struct SkipIntent { static constexpr const char *name = "skip"; double delta; };
struct WakeUpIntent { static constexpr const char *name = "wakeUp"; };
struct SetSpeedIntent { static constexpr const char *name = "setSpeed"; double rate; };
struct ResetSpeedIntent { static constexpr const char *name = "resetSpeed"; };
struct SyncIntent { static constexpr const char *name = "sync"; };
struct SaveSelectionIntent { static constexpr const char *name = "savePaths"; MediaSelection paths; };
struct FullscreenIntent { static constexpr const char *name = "fullscreen"; };

using ControlIntent = std::variant<PlayIntent, PauseIntent, StopIntent, SeekIntent, SkipIntent, WakeUpIntent,
                                   SetSpeedIntent, ResetSpeedIntent, SyncIntent, SaveSelectionIntent,
                                   FullscreenIntent>;

inline std::string intent_name(const ControlIntent &intent)
{
    return std::visit([](const auto &i)
                      { return std::string(std::decay_t<decltype(i)>::name); },
                      intent);
}

struct ControlOutcome
{
    bool ok = false;
    std::string text; // message when ok, error otherwise
};

// -------- helpers --------

namespace detail
{
    inline void send_to(ControlContext &ctx, Role r, const PlayerCommand &cmd)
    {
        if (ctx.players.send(ctx.participant(r), cmd) == SendResult::TransportFailed)
            ctx.log.error(std::string(role_name(r)) + " did not receive " + describe(cmd));
    }

    inline void send_both(ControlContext &ctx, const PlayerCommand &cmd)
    {
        send_to(ctx, Role::Master, cmd);
        send_to(ctx, Role::Slave, cmd);
    }

    inline StatusPair poll(ControlContext &ctx)
    {
        return poll_both(ctx.players, ctx.master, ctx.slave);
    }

    inline void require_selection(const ControlContext &ctx)
    {
        if (!ctx.selection.complete())
            throw ControlError("File paths not found. Save them first.");
    }

    inline std::string fixed1(double v)
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << v;
        return oss.str();
    }

    struct FullscreenBefore
    {
        bool master = false;
        bool slave = false;
    };

    // Toggle fullscreen on whichever player is not already there.
    // An unreachable player counts as windowed and gets the toggle.
    inline FullscreenBefore ensure_fullscreen(ControlContext &ctx)
    {
        auto st = poll(ctx);
        FullscreenBefore before;
        before.master = st.master && st.master->fullscreen;
        before.slave = st.slave && st.slave->fullscreen;
        ctx.log.action(std::string("fullscreen before: master=") + (before.master ? "on" : "off") +
                       " slave=" + (before.slave ? "on" : "off"));
        if (!before.master)
            send_to(ctx, Role::Master, PlayerCommand::toggle_fullscreen());
        if (!before.slave)
            send_to(ctx, Role::Slave, PlayerCommand::toggle_fullscreen());
        return before;
    }

    inline std::string fullscreen_report(const FullscreenBefore &b)
    {
        return std::string("Fullscreen: Master - ") + (b.master ? "already" : "now") + " ON, Slave - " +
               (b.slave ? "already" : "now") + " ON.";
    }

    // enqueue -> next -> rate 1.0 -> seek 0, on both players
    inline void stage_from_start(ControlContext &ctx, std::chrono::milliseconds after_enqueue)
    {
        ctx.log.action("Enqueuing media files on both players...");
        send_to(ctx, Role::Master, PlayerCommand::enqueue(ctx.selection.master_path));
        send_to(ctx, Role::Slave, PlayerCommand::enqueue(ctx.selection.slave_path));
        if (after_enqueue.count() > 0)
            ctx.delay(after_enqueue);

        ctx.log.action("Activating enqueued files");
        send_both(ctx, PlayerCommand::play_next());
        send_both(ctx, PlayerCommand::set_rate(1.0));
        send_both(ctx, PlayerCommand::seek(0.0));
    }

    inline void apply_rate(ControlContext &ctx, double rate)
    {
        ctx.log.action("Setting speed to " + format_number(rate) + "x on both systems");
        send_both(ctx, PlayerCommand::set_rate(rate));
        ctx.delay(ctx.policy.rate_delay);
    }

    // load-and-play the participant's media, wait, and insist on a timed status
    inline PlayerStatus reload(ControlContext &ctx, Role r)
    {
        const std::string &path = ctx.selection.path_for(r);
        ctx.log.action(std::string("Reloading ") + role_name(r) + " with \"" + path + "\"");
        send_to(ctx, r, PlayerCommand::load_and_play(path));
        ctx.delay(ctx.policy.reload_delay);
        auto st = ctx.players.query(ctx.participant(r));
        if (!st || !st->time_known)
            throw ControlError(std::string(role_label(r)) + " VLC is unreachable or failed to reload.");
        return *st;
    }
}

// -------- handlers --------

inline std::string handle(const PlayIntent &, ControlContext &ctx)
{
    detail::require_selection(ctx);
    auto st = detail::poll(ctx);
    const bool resuming = (st.master && st.master->state == PlayState::Paused) ||
                          (st.slave && st.slave->state == PlayState::Paused);

    if (!resuming)
    {
        detail::stage_from_start(ctx, std::chrono::milliseconds{0});
        ctx.log.action("Waiting before starting playback...");
        ctx.delay(ctx.policy.settle_delay);
    }

    detail::send_both(ctx, PlayerCommand::play());

    ctx.delay(ctx.policy.fullscreen_delay);
    auto before = detail::ensure_fullscreen(ctx);

    if (resuming)
        return "Playback resumed from paused position. " + detail::fullscreen_report(before);
    return "Playback started in sync after " + format_number(ctx.policy.settle_delay.count() / 1000.0) +
           "-second buffer. Rate set to 1.0x. " + detail::fullscreen_report(before);
}

inline std::string handle(const PauseIntent &, ControlContext &ctx)
{
    auto st = detail::poll(ctx);
    if (!st.master || !st.slave)
        throw ControlError("Could not retrieve player status.");

    // catch the laggard up to the leader before anything stops moving
    const double max_time = std::max(st.master->elapsed, st.slave->elapsed);
    detail::send_both(ctx, PlayerCommand::seek(max_time));

    if (st.master->state == PlayState::Playing)
        detail::send_to(ctx, Role::Master, PlayerCommand::pause());
    if (st.slave->state == PlayState::Playing)
        detail::send_to(ctx, Role::Slave, PlayerCommand::pause());

    return "Both players synced to " + format_number(max_time) + " sec and paused (no toggling).";
}

inline std::string handle(const StopIntent &, ControlContext &ctx)
{
    detail::send_both(ctx, PlayerCommand::stop());
    return "Both players stopped.";
}

inline std::string handle(const SeekIntent &intent, ControlContext &ctx)
{
    if (!std::isfinite(intent.seconds))
        throw ControlError("Invalid or missing seek value.");
    detail::send_both(ctx, PlayerCommand::seek(intent.seconds));
    return "Seek command sent (" + format_number(intent.seconds) + " sec).";
}

inline std::string handle(const SkipIntent &intent, ControlContext &ctx)
{
    auto st = detail::poll(ctx);
    if (!st.master || !st.slave)
        throw ControlError("Could not retrieve player status.");

    // each player moves relative to its own position
    detail::send_to(ctx, Role::Master, PlayerCommand::seek(std::max(0.0, st.master->elapsed + intent.delta)));
    detail::send_to(ctx, Role::Slave, PlayerCommand::seek(std::max(0.0, st.slave->elapsed + intent.delta)));

    return std::string("Skipped ") + (intent.delta < 0 ? "backward " : "forward ") +
           format_number(std::abs(intent.delta)) + " seconds.";
}

inline std::string handle(const WakeUpIntent &, ControlContext &ctx)
{
    detail::require_selection(ctx);
    detail::stage_from_start(ctx, ctx.policy.enqueue_delay);
    ctx.delay(ctx.policy.settle_delay);
    detail::send_both(ctx, PlayerCommand::play());
    auto before = detail::ensure_fullscreen(ctx);
    return "Wake-up completed: media loaded, rate set, playback started smoothly. " +
           detail::fullscreen_report(before);
}

inline std::string handle(const SetSpeedIntent &intent, ControlContext &ctx)
{
    if (!std::isfinite(intent.rate) || intent.rate <= 0.0)
        throw ControlError("Invalid speed value. Must be a positive number.");
    detail::apply_rate(ctx, intent.rate);
    return "Speed set to " + format_number(intent.rate) + "x on both players.";
}

inline std::string handle(const ResetSpeedIntent &, ControlContext &ctx)
{
    detail::apply_rate(ctx, 1.0);
    return "Speed reset to 1.0x on both players.";
}

inline std::string handle(const SaveSelectionIntent &intent, ControlContext &ctx)
{
    const auto &sel = intent.paths;
    ctx.log.action("savePaths received. masterFile: \"" + sel.master_path + "\", slaveFile: \"" +
                   sel.slave_path + "\"");
    if (!sel.complete())
        throw ControlError("Missing file paths.");
    if (!sel.storable())
        throw ControlError("Invalid file paths: line breaks are not allowed.");

    try
    {
        ctx.paths.save(sel);
    }
    catch (const std::exception &e)
    {
        ctx.log.error(std::string("Error saving paths: ") + e.what());
        throw ControlError(std::string("Failed to save paths: ") + e.what());
    }
    ctx.log.action("Paths saved to " + ctx.paths.file().string());

    MediaSelection back;
    try
    {
        back = ctx.paths.load();
    }
    catch (const std::exception &e)
    {
        ctx.log.error(std::string("Error reading back paths: ") + e.what());
        throw ControlError(std::string("Failed to save paths: ") + e.what());
    }
    ctx.log.action("Verification - read back: masterFile=\"" + back.master_path + "\", slaveFile=\"" +
                   back.slave_path + "\"");
    if (back.master_path != sel.master_path || back.slave_path != sel.slave_path)
        throw ControlError("Failed to save paths: read-back does not match");

    ctx.selection = back;
    return "Paths saved successfully.";
}

inline std::string handle(const FullscreenIntent &, ControlContext &ctx)
{
    // give a play issued just before this a moment to open the video window
    ctx.delay(ctx.policy.fullscreen_delay);
    auto before = detail::ensure_fullscreen(ctx);
    return detail::fullscreen_report(before);
}

inline std::string handle(const SyncIntent &, ControlContext &ctx)
{
    detail::require_selection(ctx);
    const SyncPolicy &pol = ctx.policy;

    auto st = poll_until_timed(ctx.players, ctx.master, ctx.slave, pol.status_attempts, pol.retry_delay, ctx.delay);
    const bool master_ok = st.timed(Role::Master);
    const bool slave_ok = st.timed(Role::Slave);

    if (!master_ok && !slave_ok)
        throw ControlError("Both VLC systems are unreachable.");
    if (!master_ok)
        st.master = detail::reload(ctx, Role::Master);
    else if (!slave_ok)
        st.slave = detail::reload(ctx, Role::Slave);

    // stalled or stopped players are reloaded so both positions are comparable
    if (st.master->state != PlayState::Playing)
        st.master = detail::reload(ctx, Role::Master);
    if (st.slave->state != PlayState::Playing)
        st.slave = detail::reload(ctx, Role::Slave);

    const double m = st.master->elapsed;
    const double s = st.slave->elapsed;
    const double drift = std::abs(m - s);

    if (drift <= pol.drift_tolerance_s)
    {
        ctx.log.action("Drift " + format_number(drift) + "s within tolerance, no correction");
        return "Players already in sync (drift " + detail::fixed1(drift) + " sec). No correction needed.";
    }

    if (m < s)
    {
        detail::send_to(ctx, Role::Master, PlayerCommand::seek(s + pol.lead_compensation_s));
        ctx.log.action("Synced master from " + detail::fixed1(m) + "s to " + detail::fixed1(s) + "s");
    }
    else
    {
        detail::send_to(ctx, Role::Slave, PlayerCommand::seek(m + pol.lead_compensation_s));
        ctx.log.action("Synced slave from " + detail::fixed1(s) + "s to " + detail::fixed1(m) + "s");
    }

    detail::send_both(ctx, PlayerCommand::play());

    const double final_time = std::max(m, s) + pol.lead_compensation_s;
    return "Sync complete. Both players are now playing at ~" + detail::fixed1(final_time) + " sec.";
}

// -------- dispatch --------

inline ControlOutcome run_intent(const ControlIntent &intent, ControlContext &ctx)
{
    const std::string name = intent_name(intent);
    ctx.log.action("Intent: " + name);
    try
    {
        std::string msg = std::visit([&ctx](const auto &i)
                                     { return handle(i, ctx); },
                                     intent);
        ctx.log.action(name + " done: " + msg);
        return {true, msg};
    }
    catch (const ControlError &e)
    {
        ctx.log.action(name + " rejected: " + e.what());
        return {false, e.what()};
    }
    catch (const std::exception &e)
    {
        ctx.log.error(name + " failed: " + e.what());
        return {false, e.what()};
    }
}
