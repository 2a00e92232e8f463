/*
 * File: src/duosync_state.hpp
 * Project: DuoSync
 * Purpose: Long-lived server state shared by the HTTP sessions
 * Notes:
 *  - Participants and credential are fixed at construction
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <memory>
#include <string>

#include "action_log.hpp"
#include "duosync_config.hpp"
#include "path_store.hpp"
#include "player_client.hpp"
#include "sync_controller.hpp"


struct DuoSyncState {
Config config;
ActionLog log;
PathStore paths;
std::unique_ptr<PlayerClient> players;
Participant master;
Participant slave;
DelayFn delay = sleep_delay;
std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

// players == nullptr selects the HTTP client
DuoSyncState(Config cfg, const std::string &password, std::unique_ptr<PlayerClient> client = nullptr)
    : config(std::move(cfg)), log(config.data_dir), paths(config.data_dir), players(std::move(client)),
      master{Role::Master, config.master_url, password}, slave{Role::Slave, config.slave_url, password}
{
    if (!players)
        players = std::make_unique<HttpPlayerClient>(log, config.timeout);
}

ControlContext context()
{
    return ControlContext{*players, master, slave, paths, log, config.policy, delay, {}};
}
};
