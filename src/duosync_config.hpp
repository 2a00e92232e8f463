/*
 * File: src/duosync_config.hpp
 * Project: DuoSync
 * Purpose: Command-line and environment configuration
 * Notes:
 *  - VLC_PASSWORD is mandatory; the server refuses to start without it
 *  - PORT overrides the listen port when --http is not given
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "player_client.hpp"
#include "sync_controller.hpp"

struct Config
{
    std::string http_bind = "0.0.0.0:3000";
    std::string data_dir = ".";
    std::string master_url = "http://192.168.127.177:8080";
    std::string slave_url = "http://192.168.127.141:8080";
    std::chrono::milliseconds timeout{3000};
    SyncPolicy policy{};
};

inline std::pair<std::string, unsigned short> split_host_port(const std::string &s)
{
    auto p = s.rfind(':');
    if (p == std::string::npos || p == 0 || p + 1 == s.size())
        throw std::invalid_argument("expected host:port, got \"" + s + "\"");
    int port = 0;
    try
    {
        port = std::stoi(s.substr(p + 1));
    }
    catch (const std::exception &)
    {
        throw std::invalid_argument("bad port in \"" + s + "\"");
    }
    if (port < 0 || port > 65535)
        throw std::invalid_argument("port out of range in \"" + s + "\"");
    return {s.substr(0, p), static_cast<unsigned short>(port)};
}

namespace detail
{
    inline double flag_double(const std::string &flag, const std::string &v)
    {
        try
        {
            size_t used = 0;
            double d = std::stod(v, &used);
            if (used != v.size() || !std::isfinite(d))
                throw std::invalid_argument(v);
            return d;
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument(flag + " expects a number, got \"" + v + "\"");
        }
    }

    inline int flag_int(const std::string &flag, const std::string &v)
    {
        try
        {
            size_t used = 0;
            int n = std::stoi(v, &used);
            if (used != v.size())
                throw std::invalid_argument(v);
            return n;
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument(flag + " expects an integer, got \"" + v + "\"");
        }
    }
}

// port_env is the value of $PORT (or null); throws std::invalid_argument on bad input.
inline Config parse_args(int argc, char **argv, const char *port_env)
{
    Config cfg;
    bool http_given = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (i + 1 >= argc)
            throw std::invalid_argument("missing value for " + a);
        std::string v = argv[++i];
        if (a == "--http")
        {
            cfg.http_bind = v;
            http_given = true;
        }
        else if (a == "--data")
            cfg.data_dir = v;
        else if (a == "--master")
            cfg.master_url = v;
        else if (a == "--slave")
            cfg.slave_url = v;
        else if (a == "--drift-tolerance")
            cfg.policy.drift_tolerance_s = detail::flag_double(a, v);
        else if (a == "--lead")
            cfg.policy.lead_compensation_s = detail::flag_double(a, v);
        else if (a == "--retries")
            cfg.policy.status_attempts = detail::flag_int(a, v);
        else if (a == "--timeout-ms")
            cfg.timeout = std::chrono::milliseconds(detail::flag_int(a, v));
        else
            throw std::invalid_argument("unknown option " + a);
    }

    if (!http_given && port_env && *port_env)
        cfg.http_bind = "0.0.0.0:" + std::string(port_env);

    split_host_port(cfg.http_bind); // validate early
    parse_base_url(cfg.master_url);
    parse_base_url(cfg.slave_url);
    if (cfg.policy.drift_tolerance_s < 0.0)
        throw std::invalid_argument("--drift-tolerance must not be negative");
    if (cfg.policy.lead_compensation_s < 0.0)
        throw std::invalid_argument("--lead must not be negative");
    if (cfg.policy.status_attempts < 1)
        throw std::invalid_argument("--retries must be at least 1");
    if (cfg.timeout.count() <= 0)
        throw std::invalid_argument("--timeout-ms must be positive");
    return cfg;
}

// Credential for both players. Absent or empty is fatal.
inline std::string require_password(const char *env)
{
    if (!env || !*env)
        throw std::runtime_error("VLC_PASSWORD environment variable is required");
    return env;
}

inline nlohmann::json config_to_json(const Config &cfg)
{
    return nlohmann::json{
        {"http", cfg.http_bind},
        {"data_dir", cfg.data_dir},
        {"master", cfg.master_url},
        {"slave", cfg.slave_url},
        {"timeout_ms", cfg.timeout.count()},
        {"drift_tolerance_s", cfg.policy.drift_tolerance_s},
        {"lead_compensation_s", cfg.policy.lead_compensation_s},
        {"status_attempts", cfg.policy.status_attempts},
        {"skip_step_s", cfg.policy.skip_step_s}};
}
