/*
 * File: src/control_endpoint.hpp
 * Project: DuoSync
 * Purpose: POST /control request parsing, path resolution and reply shape
 * Notes:
 *  - Reply is exactly one of {"message": ...} or {"error": ...}
 *  - Accepts application/json and application/x-www-form-urlencoded bodies
 * Last updated: 2026-10-18
 */

#pragma once
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "path_store.hpp"
#include "sync_controller.hpp"

struct ControlRequest
{
    std::string command;
    std::string master_file;
    std::string slave_file;
    double seek_value = std::numeric_limits<double>::quiet_NaN();
    double speed = std::numeric_limits<double>::quiet_NaN();
};

inline nlohmann::json outcome_to_json(const ControlOutcome &o)
{
    return o.ok ? nlohmann::json{{"message", o.text}} : nlohmann::json{{"error", o.text}};
}

// NaN for anything that is not a finite number or a string holding one.
inline double parse_number_field(const nlohmann::json &j)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    if (j.is_number())
        return j.get<double>();
    if (!j.is_string())
        return nan;
    std::string s = j.get<std::string>();
    auto a = s.find_first_not_of(" \t");
    auto b = s.find_last_not_of(" \t");
    if (a == std::string::npos)
        return nan;
    s = s.substr(a, b - a + 1);
    char *end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0')
        return nan;
    return v;
}

inline std::string url_decode(const std::string &s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        char c = s[i];
        if (c == '+')
        {
            out += ' ';
        }
        else if (c == '%' && i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
                 std::isxdigit(static_cast<unsigned char>(s[i + 2])))
        {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        }
        else
        {
            out += c;
        }
    }
    return out;
}

// a=b&c=d into a flat JSON object of strings
inline nlohmann::json parse_form(const std::string &body)
{
    nlohmann::json out = nlohmann::json::object();
    size_t pos = 0;
    while (pos <= body.size())
    {
        auto amp = body.find('&', pos);
        std::string pair = body.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (!pair.empty())
        {
            auto eq = pair.find('=');
            std::string k = url_decode(pair.substr(0, eq));
            std::string v = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
            out[k] = v;
        }
        if (amp == std::string::npos)
            break;
        pos = amp + 1;
    }
    return out;
}

// Throws std::invalid_argument when the body is not a JSON object or form.
inline ControlRequest parse_control_request(const std::string &body, const std::string &content_type)
{
    nlohmann::json j;
    if (content_type.find("application/x-www-form-urlencoded") != std::string::npos)
    {
        j = parse_form(body);
    }
    else
    {
        j = body.empty() ? nlohmann::json::object() : nlohmann::json::parse(body, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            throw std::invalid_argument("Request body must be a JSON object.");
    }

    auto str = [&j](const char *k)
    {
        if (!j.contains(k) || !j[k].is_string())
            return std::string();
        return j[k].get<std::string>();
    };

    ControlRequest req;
    req.command = str("command");
    req.master_file = str("masterFile");
    req.slave_file = str("slaveFile");
    if (j.contains("seekValue"))
        req.seek_value = parse_number_field(j["seekValue"]);
    if (j.contains("speed"))
        req.speed = parse_number_field(j["speed"]);
    return req;
}

inline std::optional<ControlIntent> intent_for(const ControlRequest &req, const SyncPolicy &policy)
{
    const std::string &c = req.command;
    if (c == "play")
        return PlayIntent{};
    if (c == "pause")
        return PauseIntent{};
    if (c == "stop")
        return StopIntent{};
    if (c == "seek")
        return SeekIntent{req.seek_value};
    if (c == "skip_forward")
        return SkipIntent{policy.skip_step_s};
    if (c == "skip_backward")
        return SkipIntent{-policy.skip_step_s};
    if (c == "wakeUp")
        return WakeUpIntent{};
    if (c == "setSpeed")
        return SetSpeedIntent{req.speed};
    if (c == "resetSpeed")
        return ResetSpeedIntent{};
    if (c == "sync")
        return SyncIntent{};
    if (c == "savePaths")
        return SaveSelectionIntent{MediaSelection{req.master_file, req.slave_file}};
    if (c == "fullscreen")
        return FullscreenIntent{};
    return std::nullopt;
}

// ctx is taken by value: the resolved selection lives only for this request.
inline ControlOutcome handle_control(const ControlRequest &req, ControlContext ctx)
{
    ctx.log.action("Accessed /control: command=\"" + req.command + "\" masterFile=\"" + req.master_file +
                   "\" slaveFile=\"" + req.slave_file + "\"");

    auto intent = intent_for(req, ctx.policy);
    if (!intent)
        return {false, "Invalid command."};

    if (!std::holds_alternative<SaveSelectionIntent>(*intent))
    {
        MediaSelection sel{req.master_file, req.slave_file};
        if (sel.slave_path.empty())
            sel.slave_path = sel.master_path; // single-file callers

        if (sel.master_path.empty() || sel.slave_path.empty())
        {
            MediaSelection stored;
            try
            {
                ctx.log.action("Reading paths from " + ctx.paths.file().string());
                stored = ctx.paths.load();
            }
            catch (const std::exception &e)
            {
                ctx.log.error(std::string("Error reading paths: ") + e.what());
                return {false, std::string("Failed to read paths: ") + e.what()};
            }
            ctx.log.action("Read paths: masterFile=\"" + stored.master_path + "\", slaveFile=\"" +
                           stored.slave_path + "\"");
            if (sel.master_path.empty())
                sel.master_path = stored.master_path;
            if (sel.slave_path.empty())
                sel.slave_path = stored.slave_path;
        }
        if (!sel.complete())
            return {false, "No file paths found. Please save file paths first."};
        ctx.selection = sel;
    }

    return run_intent(*intent, ctx);
}
