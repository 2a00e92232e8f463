/*
 * File: tests/test_player_status.cpp
 * Project: DuoSync
 * Purpose: Status document coercion
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include "common/player_status.hpp"

using nlohmann::json;


TEST_CASE("typical VLC status document"){
auto st = status_from_json(json::parse(R"({"state":"playing","time":125,"length":3600,"rate":1.5,"fullscreen":true,"volume":256})"));
CHECK(st.state == PlayState::Playing);
CHECK(st.elapsed == 125.0); CHECK(st.time_known);
CHECK(st.fullscreen);
CHECK(st.length == 3600.0); CHECK(st.rate == 1.5);
}


TEST_CASE("missing fields fall back to safe values"){
auto st = status_from_json(json::object());
CHECK(st.state == PlayState::Unknown);
CHECK(st.elapsed == 0.0); CHECK_FALSE(st.time_known);
CHECK_FALSE(st.fullscreen);
}


TEST_CASE("fullscreen may be numeric"){
CHECK(status_from_json(json{{"fullscreen", 1}}).fullscreen);
CHECK_FALSE(status_from_json(json{{"fullscreen", 0}}).fullscreen);
CHECK_FALSE(status_from_json(json{{"fullscreen", "yes"}}).fullscreen);
}


TEST_CASE("time is coerced from strings and clamped at zero"){
auto st = status_from_json(json{{"time", "42.5"}});
CHECK(st.time_known); CHECK(st.elapsed == 42.5);
CHECK(status_from_json(json{{"time", -3}}).elapsed == 0.0);
CHECK_FALSE(status_from_json(json{{"time", "soon"}}).time_known);
CHECK_FALSE(status_from_json(json{{"time", nullptr}}).time_known);
}


TEST_CASE("unrecognised state strings map to unknown"){
CHECK(status_from_json(json{{"state", "buffering"}}).state == PlayState::Unknown);
CHECK(status_from_json(json{{"state", "paused"}}).state == PlayState::Paused);
CHECK(status_from_json(json{{"state", "stopped"}}).state == PlayState::Stopped);
CHECK(status_from_json(json::array()).state == PlayState::Unknown);
}


TEST_CASE("status json reports unknown time as null"){
PlayerStatus st; st.state = PlayState::Paused;
auto j = status_to_json(st);
CHECK(j["state"] == "paused");
CHECK(j["time"].is_null());
}
