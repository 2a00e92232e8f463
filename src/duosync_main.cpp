/*
 * File: src/duosync_main.cpp
 * Project: DuoSync
 * Purpose: Main server binary: POST /control for the master/slave player pair
 * Notes:
 *  - Refuses to start without VLC_PASSWORD
 *  - Logs land in --data (control_log.txt, control_errors.log, paths.txt)
 * Last updated: 2026-10-18
 */

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include "duosync_config.hpp"
#include "duosync_http.hpp"
#include "duosync_state.hpp"

int main(int argc, char **argv)
{
    Config cfg;
    std::string password;
    try
    {
        cfg = parse_args(argc, argv, std::getenv("PORT"));
        password = require_password(std::getenv("VLC_PASSWORD"));
    }
    catch (const std::exception &e)
    {
        std::cerr << "ERROR: " << e.what() << "\n";
        std::cerr << "usage: duosync [--http host:port] [--data dir] [--master url] [--slave url]\n"
                     "               [--drift-tolerance s] [--lead s] [--retries n] [--timeout-ms n]\n";
        return 1;
    }

    // Ensure the data directory exists before the logs try to append to it
    std::error_code ec;
    std::filesystem::create_directories(cfg.data_dir, ec);
    if (ec)
    {
        std::cerr << "ERROR: failed to ensure " << cfg.data_dir << " : " << ec.message() << "\n";
        return 1;
    }

    try
    {
        auto [http_host, http_port] = split_host_port(cfg.http_bind);

        boost::asio::io_context ioc{1};
        boost::asio::thread_pool workers{4};
        DuoSyncState state{cfg, password};

        boost::asio::ip::tcp::endpoint http_ep{boost::asio::ip::make_address(http_host), http_port};
        HttpServer http{ioc, http_ep, workers, state};

        boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([&ioc](const boost::system::error_code &, int)
                           { ioc.stop(); });

        state.log.action("Control server starting on " + cfg.http_bind);
        std::cout << "duosync listening http=" << cfg.http_bind << " master=" << cfg.master_url
                  << " slave=" << cfg.slave_url << " data=" << cfg.data_dir << "\n";

        ioc.run();
        workers.join();
    }
    catch (const std::exception &e)
    {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
