/*
 * File: src/action_log.hpp
 * Project: DuoSync
 * Purpose: Append-only action and error logs in the data directory
 * Notes:
 *  - Lines are "[YYYY-MM-DD HH:MM:SS.mmm] message", UTC
 *  - Errors are mirrored to stderr
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include "atomic_write.hpp"

// UTC with milliseconds and a space separator (e.g., 2026-10-18 14:59:01.234)
inline std::string log_timestamp_now()
{
    using namespace std::chrono;
    auto now = time_point_cast<milliseconds>(system_clock::now());
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%d %H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

class ActionLog
{
    std::filesystem::path action_path_;
    std::filesystem::path error_path_;
    std::mutex m_;

public:
    static constexpr const char *kActionFile = "control_log.txt";
    static constexpr const char *kErrorFile = "control_errors.log";

    explicit ActionLog(const std::filesystem::path &dir)
        : action_path_(dir / kActionFile), error_path_(dir / kErrorFile) {}

    void action(const std::string &msg) { write(action_path_, msg); }

    void error(const std::string &msg)
    {
        std::cerr << "ERROR: " << msg << "\n";
        write(error_path_, msg);
    }

    const std::filesystem::path &action_path() const { return action_path_; }
    const std::filesystem::path &error_path() const { return error_path_; }

private:
    void write(const std::filesystem::path &dst, const std::string &msg)
    {
        const std::string line = "[" + log_timestamp_now() + "] " + msg;
        std::scoped_lock lk(m_);
        try
        {
            append_line(dst, line);
        }
        catch (const std::exception &e)
        {
            // a broken log must not fail the intent being logged
            std::cerr << "WARN: " << e.what() << " (" << line << ")\n";
        }
    }
};
