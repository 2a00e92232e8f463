/*
 * File: include/atomic_write.hpp
 * Project: DuoSync
 * Purpose: Whole-file replacement and append helpers for the data directory
 * Notes:
 *  - Readers never observe a half-written paths.txt
 *  - Last writer wins; there is no writer locking
 * Last updated: 2026-10-18
 */


#pragma once
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>

// Atomic file writer: writes to <path>.tmp, fsyncs, then rename() to final.
inline void
write_atomic(const std::filesystem::path &final_path, const std::string &data)
{
    std::filesystem::path tmp = final_path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
            throw std::runtime_error("Failed to open temp file: " + tmp.string());
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs)
            throw std::runtime_error("Failed to write temp file: " + tmp.string());
    }
    int fd = ::open(tmp.c_str(), O_RDONLY);
    if (fd >= 0)
    {
        ::fsync(fd);
        ::close(fd);
    }
    if (::rename(tmp.c_str(), final_path.c_str()) != 0)
    {
        const std::string why = std::strerror(errno);
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("Failed to rename " + tmp.string() + ": " + why);
    }
}

inline void append_line(const std::filesystem::path &dst, const std::string &line)
{
    std::ofstream f(dst, std::ios::app);
    if (!f)
        throw std::runtime_error("open for append failed: " + dst.string());
    f << line << '\n';
    if (!f)
        throw std::runtime_error("append failed: " + dst.string());
}

inline bool read_file_all(const std::filesystem::path &p, std::string &out)
{
    std::ifstream f(p);
    if (!f)
        return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}
