/*
 * File: src/duosync_http.hpp
 * Project: DuoSync
 * Purpose: HTTP routing and handlers
 * Notes:
 *  - POST /control runs the intent on the worker pool, not the io thread
 *  - /health returns constant JSON; no shared state
 *  - One request per connection, then shutdown
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "control_endpoint.hpp"
#include "duosync_state.hpp"
#include "status_poller.hpp"

namespace http = boost::beast::http;

// -------- time helpers --------

// RFC3339 UTC with milliseconds (e.g., 2026-10-18T14:59:01.234Z)
inline std::string iso8601_now_ms()
{
    using namespace std::chrono;
    auto now = time_point_cast<milliseconds>(system_clock::now());
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

// -------- HTTP server --------

class HttpServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::thread_pool &workers_;
    DuoSyncState &state_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, boost::asio::thread_pool &workers,
               DuoSyncState &s)
        : acceptor_(ioc), socket_(ioc), workers_(workers), state_(s)
    {
        boost::system::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (!ec)
            acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (!ec)
            acceptor_.bind(ep, ec);
        if (!ec)
            acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::runtime_error("http listen on " + ep.address().to_string() + ":" +
                                     std::to_string(ep.port()) + " failed: " + ec.message());
        do_accept();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](auto ec)
                               {
            if (!ec) std::make_shared<Session>(std::move(socket_), workers_, state_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        using Response = http::response<http::string_body>;

        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        boost::asio::thread_pool &workers;
        DuoSyncState &state;

        Session(boost::asio::ip::tcp::socket &&s, boost::asio::thread_pool &w, DuoSyncState &st)
            : socket(std::move(s)), workers(w), state(st) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](auto ec, auto)
                             {
                if (!ec) self->handle(); });
        }

        // keep response alive through async_write
        void respond(Response &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<Response>(std::move(res));
            sp->set(http::field::server, "duosync-beast");

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        Response json_response(http::status st, const nlohmann::json &body) const
        {
            Response res{st, req.version()};
            res.set(http::field::content_type, "application/json");
            // stored paths are raw filename bytes and need not be UTF-8
            res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            res.prepare_payload();
            return res;
        }

        // Blocking work (player round-trips, settle delays) runs on the pool;
        // the reply is written back from the socket's executor.
        void offload(std::function<Response()> work)
        {
            auto self = shared_from_this();
            boost::asio::post(workers, [self, work = std::move(work)]()
                              {
                auto res = std::make_shared<Response>(work());
                boost::asio::post(self->socket.get_executor(), [self, res]()
                                  { self->respond(std::move(*res)); }); });
        }

        void handle()
        {
            using nlohmann::json;
            const std::string target(req.target());

            // GET /health
            if (req.method() == http::verb::get && target == "/health")
            {
                auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
                return respond(json_response(http::status::ok, json{{"status", "ok"}, {"uptime_s", up}}));
            }

            // GET /v1/config
            if (req.method() == http::verb::get && target == "/v1/config")
                return respond(json_response(http::status::ok, config_to_json(state.config)));

            // GET /v1/paths
            if (req.method() == http::verb::get && target == "/v1/paths")
            {
                try
                {
                    auto sel = state.paths.load();
                    return respond(json_response(http::status::ok,
                                                 json{{"masterFile", sel.master_path}, {"slaveFile", sel.slave_path}}));
                }
                catch (const std::exception &e)
                {
                    state.log.error(std::string("Error reading paths: ") + e.what());
                    return respond(json_response(http::status::ok,
                                                 json{{"error", std::string("Failed to read paths: ") + e.what()}}));
                }
            }

            // GET /v1/status  (live, both players; null when unreachable)
            if (req.method() == http::verb::get && target == "/v1/status")
            {
                auto self = shared_from_this();
                return offload([self]()
                               {
                    auto st = poll_both(*self->state.players, self->state.master, self->state.slave);
                    auto one = [](const std::optional<PlayerStatus> &s)
                    { return s ? status_to_json(*s) : json(nullptr); };
                    json body{{"master", one(st.master)}, {"slave", one(st.slave)}, {"ts", iso8601_now_ms()}};
                    return self->json_response(http::status::ok, body); });
            }

            // POST /control
            // Body: { "command": ..., "masterFile"?, "slaveFile"?, "seekValue"?, "speed"? }
            if (req.method() == http::verb::post && target == "/control")
            {
                ControlRequest creq;
                try
                {
                    creq = parse_control_request(req.body(), std::string(req[http::field::content_type]));
                }
                catch (const std::exception &e)
                {
                    state.log.action(std::string("Rejected /control body: ") + e.what());
                    return respond(json_response(http::status::ok, json{{"error", e.what()}}));
                }

                auto self = shared_from_this();
                return offload([self, creq]()
                               {
                    ControlOutcome out = handle_control(creq, self->state.context());
                    return self->json_response(http::status::ok, outcome_to_json(out)); });
            }

            // 404 fallback
            return respond(json_response(http::status::not_found, json{{"error", "not found"}}));
        }
    };
};
