/*
 * File: src/player_client.hpp
 * Project: DuoSync
 * Purpose: Commands and status queries against one VLC HTTP interface
 * Notes:
 *  - Fire-and-forget: send() never throws and never retries
 *  - Basic auth with an empty user name and the shared password
 *  - Each request gets its own connection and a connect/read deadline
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/detail/base64.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "action_log.hpp"
#include "common/player_status.hpp"

namespace http = boost::beast::http;

// One remote player. Fixed at process start.
struct Participant
{
    Role role = Role::Master;
    std::string base_url; // e.g. http://10.10.10.2:8080
    std::string password;
};

enum class SendResult { Sent, TransportFailed };

struct PlayerCommand
{
    enum class Kind { Enqueue, PlayNext, Play, Pause, Stop, Seek, SetRate, ToggleFullscreen, LoadAndPlay };

    Kind kind = Kind::Play;
    double value = 0.0; // Seek / SetRate
    std::string input;  // Enqueue / LoadAndPlay

    static PlayerCommand enqueue(std::string path) { return {Kind::Enqueue, 0.0, std::move(path)}; }
    static PlayerCommand play_next() { return {Kind::PlayNext, 0.0, {}}; }
    static PlayerCommand play() { return {Kind::Play, 0.0, {}}; }
    static PlayerCommand pause() { return {Kind::Pause, 0.0, {}}; }
    static PlayerCommand stop() { return {Kind::Stop, 0.0, {}}; }
    static PlayerCommand seek(double seconds) { return {Kind::Seek, seconds, {}}; }
    static PlayerCommand set_rate(double rate) { return {Kind::SetRate, rate, {}}; }
    static PlayerCommand toggle_fullscreen() { return {Kind::ToggleFullscreen, 0.0, {}}; }
    static PlayerCommand load_and_play(std::string path) { return {Kind::LoadAndPlay, 0.0, std::move(path)}; }

    bool operator==(const PlayerCommand &o) const
    {
        return kind == o.kind && value == o.value && input == o.input;
    }
};

// Shortest round-trippable-ish form: 51 -> "51", 12.3 -> "12.3".
inline std::string format_number(double v)
{
    std::ostringstream oss;
    oss << std::setprecision(15) << v;
    return oss.str();
}

// encodeURIComponent: keep A-Z a-z 0-9 - _ . ! ~ * ' ( ), escape the rest as UTF-8 bytes.
inline std::string url_encode(const std::string &s)
{
    static const char *hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '!' || c == '~' ||
            c == '*' || c == '\'' || c == '(' || c == ')')
        {
            out += static_cast<char>(c);
        }
        else
        {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

inline std::string command_name(PlayerCommand::Kind k)
{
    using K = PlayerCommand::Kind;
    switch (k)
    {
    case K::Enqueue:
        return "in_enqueue";
    case K::PlayNext:
        return "pl_next";
    case K::Play:
        return "pl_play";
    case K::Pause:
        return "pl_pause";
    case K::Stop:
        return "pl_stop";
    case K::Seek:
        return "seek";
    case K::SetRate:
        return "rate";
    case K::ToggleFullscreen:
        return "fullscreen";
    case K::LoadAndPlay:
        return "in_play";
    }
    return "";
}

inline std::string command_query(const PlayerCommand &c)
{
    using K = PlayerCommand::Kind;
    std::string q = "command=" + command_name(c.kind);
    if (c.kind == K::Seek || c.kind == K::SetRate)
        q += "&val=" + format_number(c.value);
    else if (c.kind == K::Enqueue || c.kind == K::LoadAndPlay)
        q += "&input=" + url_encode(c.input);
    return q;
}

inline std::string describe(const PlayerCommand &c)
{
    using K = PlayerCommand::Kind;
    std::string d = command_name(c.kind);
    if (c.kind == K::Seek || c.kind == K::SetRate)
        d += " " + format_number(c.value);
    else if (c.kind == K::Enqueue || c.kind == K::LoadAndPlay)
        d += " \"" + c.input + "\"";
    return d;
}

struct BaseUrl
{
    std::string host;
    std::string port;
    std::string prefix; // path before /requests, normally empty
};

// expect http://host[:port][/prefix]
inline BaseUrl parse_base_url(const std::string &url)
{
    const std::string scheme = "http://";
    if (url.rfind(scheme, 0) != 0)
        throw std::invalid_argument("player URL must start with http://: " + url);
    auto rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    BaseUrl b;
    b.prefix = (slash == std::string::npos) ? "" : rest.substr(slash);
    while (!b.prefix.empty() && b.prefix.back() == '/')
        b.prefix.pop_back();
    auto colon = hp.find(':');
    if (colon == std::string::npos)
    {
        b.host = hp;
        b.port = "80";
    }
    else
    {
        b.host = hp.substr(0, colon);
        b.port = hp.substr(colon + 1);
    }
    if (b.host.empty() || b.port.empty())
        throw std::invalid_argument("player URL has no host/port: " + url);
    return b;
}

inline std::string basic_auth_header(const std::string &password)
{
    namespace b64 = boost::beast::detail::base64;
    const std::string creds = ":" + password;
    std::string out(b64::encoded_size(creds.size()), '\0');
    out.resize(b64::encode(&out[0], creds.data(), creds.size()));
    return "Basic " + out;
}

// Seam between the controller and the network.
class PlayerClient
{
public:
    virtual ~PlayerClient() = default;

    virtual SendResult send(const Participant &p, const PlayerCommand &cmd) = 0;
    virtual std::optional<PlayerStatus> query(const Participant &p) = 0;
};

class HttpPlayerClient : public PlayerClient
{
    ActionLog &log_;
    std::chrono::milliseconds timeout_;

public:
    static constexpr const char *kStatusPath = "/requests/status.json";

    HttpPlayerClient(ActionLog &log, std::chrono::milliseconds timeout)
        : log_(log), timeout_(timeout) {}

    SendResult send(const Participant &p, const PlayerCommand &cmd) override
    {
        const std::string target = std::string(kStatusPath) + "?" + command_query(cmd);
        auto body = get(p, target, "command");
        if (!body)
            return SendResult::TransportFailed;
        return SendResult::Sent;
    }

    std::optional<PlayerStatus> query(const Participant &p) override
    {
        auto body = get(p, kStatusPath, "status query");
        if (!body)
            return std::nullopt;
        auto j = nlohmann::json::parse(*body, nullptr, false);
        if (j.is_discarded() || !j.is_object())
        {
            log_.error(std::string("status query error: ") + role_name(p.role) + " returned a non-JSON status document");
            return std::nullopt;
        }
        return status_from_json(j);
    }

private:
    std::optional<std::string> get(const Participant &p, const std::string &path, const char *what)
    {
        namespace beast = boost::beast;
        try
        {
            const BaseUrl base = parse_base_url(p.base_url);
            boost::asio::io_context ioc;
            boost::asio::ip::tcp::resolver res{ioc};
            beast::tcp_stream stream{ioc};

            stream.expires_after(timeout_);
            auto const results = res.resolve(base.host, base.port);
            stream.connect(results);

            http::request<http::empty_body> req{http::verb::get, base.prefix + path, 11};
            req.set(http::field::host, base.host);
            req.set(http::field::user_agent, "duosync");
            req.set(http::field::authorization, basic_auth_header(p.password));

            stream.expires_after(timeout_);
            http::write(stream, req);

            beast::flat_buffer buf;
            http::response<http::string_body> resp;
            http::read(stream, buf, resp);

            beast::error_code ec;
            stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);

            if (resp.result() == http::status::unauthorized)
                log_.error(std::string(what) + ": " + role_name(p.role) + " rejected the credential (401)");
            return resp.body();
        }
        catch (const std::exception &e)
        {
            log_.error(std::string(what) + " error: " + role_name(p.role) + " " + p.base_url + ": " + e.what());
            return std::nullopt;
        }
    }
};
