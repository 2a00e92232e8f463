/*
 * File: tests/test_player_client.cpp
 * Project: DuoSync
 * Purpose: VLC command encoding and the HTTP client against a loopback server
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <string>
#include <thread>
#include "fake_players.hpp"
#include "player_client.hpp"

using Cmd = PlayerCommand;
using tcp = boost::asio::ip::tcp;

namespace
{
    // Accepts one connection, records the request, answers with a canned body.
    struct OneShotServer
    {
        boost::asio::io_context ioc;
        tcp::acceptor acceptor{ioc, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
        http::request<http::string_body> seen;
        std::string reply_body;
        http::status reply_status = http::status::ok;
        std::string failure;
        std::thread th;

        void start()
        {
            th = std::thread([this]
                             {
                try
                {
                    tcp::socket s{ioc};
                    acceptor.accept(s);
                    boost::beast::flat_buffer b;
                    http::read(s, b, seen);
                    http::response<http::string_body> r{reply_status, 11};
                    r.set(http::field::content_type, "application/json");
                    r.body() = reply_body;
                    r.prepare_payload();
                    http::write(s, r);
                    boost::system::error_code ec;
                    s.shutdown(tcp::socket::shutdown_both, ec);
                }
                catch (const std::exception &e)
                {
                    failure = e.what();
                } });
        }

        void join()
        {
            if (th.joinable())
                th.join();
        }

        ~OneShotServer() { join(); }

        std::string url() const { return "http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()); }
    };

    // A port nothing listens on.
    unsigned short dead_port()
    {
        boost::asio::io_context ioc;
        tcp::acceptor a{ioc, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
        auto p = a.local_endpoint().port();
        a.close();
        return p;
    }
}

TEST_CASE("commands encode to VLC query strings")
{
    CHECK(command_query(Cmd::enqueue("/home/u/My Video (1).mp4")) ==
          "command=in_enqueue&input=%2Fhome%2Fu%2FMy%20Video%20(1).mp4");
    CHECK(command_query(Cmd::load_and_play("a&b=c.mkv")) == "command=in_play&input=a%26b%3Dc.mkv");
    CHECK(command_query(Cmd::play_next()) == "command=pl_next");
    CHECK(command_query(Cmd::play()) == "command=pl_play");
    CHECK(command_query(Cmd::pause()) == "command=pl_pause");
    CHECK(command_query(Cmd::stop()) == "command=pl_stop");
    CHECK(command_query(Cmd::seek(51.0)) == "command=seek&val=51");
    CHECK(command_query(Cmd::seek(12.3)) == "command=seek&val=12.3");
    CHECK(command_query(Cmd::set_rate(1.0)) == "command=rate&val=1");
    CHECK(command_query(Cmd::set_rate(0.75)) == "command=rate&val=0.75");
    CHECK(command_query(Cmd::toggle_fullscreen()) == "command=fullscreen");
}

TEST_CASE("non-ASCII paths are percent-encoded as UTF-8 bytes")
{
    CHECK(url_encode("caf\xC3\xA9.mp4") == "caf%C3%A9.mp4");
}

TEST_CASE("basic auth uses an empty user name")
{
    CHECK(basic_auth_header("secret") == "Basic OnNlY3JldA==");
    CHECK(basic_auth_header("") == "Basic Og==");
}

TEST_CASE("base URLs split into host, port and prefix")
{
    auto b = parse_base_url("http://10.10.10.2:8080");
    CHECK(b.host == "10.10.10.2");
    CHECK(b.port == "8080");
    CHECK(b.prefix.empty());

    b = parse_base_url("http://vlc.local/remote/");
    CHECK(b.host == "vlc.local");
    CHECK(b.port == "80");
    CHECK(b.prefix == "/remote");

    CHECK_THROWS_AS(parse_base_url("https://vlc.local"), std::invalid_argument);
    CHECK_THROWS_AS(parse_base_url("http://:8080"), std::invalid_argument);
}

TEST_CASE("send issues an authorised GET against status.json")
{
    TempDir d;
    ActionLog log{d.path};
    HttpPlayerClient client{log, std::chrono::milliseconds(2000)};

    OneShotServer srv;
    srv.reply_body = R"({"state":"playing"})";
    srv.start();

    Participant p{Role::Slave, srv.url(), "secret"};
    auto r = client.send(p, Cmd::seek(51.0));
    srv.join();

    REQUIRE(srv.failure.empty());
    CHECK(r == SendResult::Sent);
    CHECK(srv.seen.method() == http::verb::get);
    CHECK(std::string(srv.seen.target()) == "/requests/status.json?command=seek&val=51");
    CHECK(std::string(srv.seen[http::field::authorization]) == "Basic OnNlY3JldA==");
}

TEST_CASE("query parses the status document")
{
    TempDir d;
    ActionLog log{d.path};
    HttpPlayerClient client{log, std::chrono::milliseconds(2000)};

    OneShotServer srv;
    srv.reply_body = R"({"state":"paused","time":77,"fullscreen":false,"length":300})";
    srv.start();

    auto st = client.query(Participant{Role::Master, srv.url(), "pw"});
    srv.join();

    REQUIRE(st);
    CHECK(std::string(srv.seen.target()) == "/requests/status.json");
    CHECK(st->state == PlayState::Paused);
    CHECK(st->elapsed == 77.0);
    CHECK_FALSE(st->fullscreen);
}

TEST_CASE("a rejected credential still counts as sent but yields no status")
{
    TempDir d;
    ActionLog log{d.path};
    HttpPlayerClient client{log, std::chrono::milliseconds(2000)};

    OneShotServer srv;
    srv.reply_status = http::status::unauthorized;
    srv.reply_body = "<html>401</html>";
    srv.start();

    auto st = client.query(Participant{Role::Master, srv.url(), "wrong"});
    srv.join();
    CHECK_FALSE(st);

    std::string errors;
    REQUIRE(read_file_all(log.error_path(), errors));
    CHECK(errors.find("401") != std::string::npos);
}

TEST_CASE("unreachable players become typed failures, not exceptions")
{
    TempDir d;
    ActionLog log{d.path};
    HttpPlayerClient client{log, std::chrono::milliseconds(500)};
    Participant p{Role::Master, "http://127.0.0.1:" + std::to_string(dead_port()), "pw"};

    CHECK(client.send(p, Cmd::play()) == SendResult::TransportFailed);
    CHECK_FALSE(client.query(p));

    std::string errors;
    REQUIRE(read_file_all(log.error_path(), errors));
    CHECK(errors.find("master") != std::string::npos);
}
