/*
 * File: clients/ctl_client/ctl_client_main.cpp
 * Project: DuoSync
 * Purpose: Command-line remote: sends one intent to POST /control
 * Notes:
 *  - Exit 0 on {"message"}, 2 on {"error"}, 1 when the server is unreachable
 * Last updated: 2026-10-18
 */

#include <iostream>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <nlohmann/json.hpp>
#include <string>

namespace http = boost::beast::http;
using json = nlohmann::json;

int main(int argc, char **argv)
{
    bool pretty = false;
    std::string base = "http://localhost:3000";
    json body = json::object();
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--command" && i + 1 < argc)
            body["command"] = argv[++i];
        else if (a == "--master-file" && i + 1 < argc)
            body["masterFile"] = argv[++i];
        else if (a == "--slave-file" && i + 1 < argc)
            body["slaveFile"] = argv[++i];
        else if (a == "--seek" && i + 1 < argc)
            body["seekValue"] = argv[++i];
        else if (a == "--speed" && i + 1 < argc)
            body["speed"] = argv[++i];
        else if (a == "--pretty")
            pretty = true;
        else
        {
            std::cerr << "usage: duosync_ctl --command <play|pause|stop|seek|skip_forward|skip_backward|wakeUp|"
                         "setSpeed|resetSpeed|sync|savePaths|fullscreen>\n"
                         "                   [--http http://host:port] [--master-file p] [--slave-file p]\n"
                         "                   [--seek s] [--speed x] [--pretty]\n";
            return 1;
        }
    }
    if (!body.contains("command"))
    {
        std::cerr << "[ctl] --command is required\n";
        return 1;
    }

    try
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto pos = base.find("//");
        auto hp = pos == std::string::npos ? base : base.substr(pos + 2);
        auto host = hp.substr(0, hp.find(":"));
        auto port = hp.find(":") == std::string::npos ? std::string("80") : hp.substr(host.size() + 1);
        auto results = res.resolve(host, port);

        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        http::request<http::string_body> req{http::verb::post, "/control", 11};
        req.set(http::field::host, host);
        req.set(http::field::content_type, "application/json");
        req.body() = body.dump();
        req.prepare_payload();
        http::write(sock, req);
        boost::beast::flat_buffer buf;
        http::response<http::string_body> resp;
        http::read(sock, buf, resp);

        boost::system::error_code ignored;
        sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);

        auto j = json::parse(resp.body(), nullptr, false);
        if (j.is_discarded())
        {
            std::cout << "[ctl] status=" << resp.result_int() << " raw body=" << resp.body() << std::endl;
            return 1;
        }
        std::cout << (pretty ? j.dump(2) : j.dump()) << std::endl;
        return j.contains("error") ? 2 : 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[ctl] request failed: " << e.what() << std::endl;
        return 1;
    }
}
