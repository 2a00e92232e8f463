/*
 * File: src/path_store.hpp
 * Project: DuoSync
 * Purpose: Durable record of the media selected for each participant
 * Notes:
 *  - paths.txt holds MASTER_VIDEO_PATH=... and SLAVE_VIDEO_PATH=... lines
 *  - Saves replace the whole record via write_atomic
 * Last updated: 2026-10-18
 */

#pragma once
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>

#include "atomic_write.hpp"
#include "common/player_status.hpp"

struct MediaSelection
{
    std::string master_path;
    std::string slave_path;

    const std::string &path_for(Role r) const { return r == Role::Master ? master_path : slave_path; }
    bool complete() const { return !master_path.empty() && !slave_path.empty(); }
    // the record is line based, so a path may not carry its own line break
    bool storable() const
    {
        return master_path.find_first_of("\r\n") == std::string::npos &&
               slave_path.find_first_of("\r\n") == std::string::npos;
    }
};

class PathStore
{
    std::filesystem::path file_;

public:
    static constexpr const char *kFileName = "paths.txt";
    static constexpr const char *kMasterKey = "MASTER_VIDEO_PATH=";
    static constexpr const char *kSlaveKey = "SLAVE_VIDEO_PATH=";

    explicit PathStore(const std::filesystem::path &dir) : file_(dir / kFileName) {}

    const std::filesystem::path &file() const { return file_; }

    bool exists() const
    {
        std::error_code ec;
        return std::filesystem::exists(file_, ec);
    }

    // A missing record is an empty selection; an unreadable one is an error.
    MediaSelection load() const
    {
        MediaSelection sel;
        if (!exists())
            return sel;
        std::string content;
        if (!read_file_all(file_, content))
            throw std::runtime_error("cannot read " + file_.string());
        return parse(content);
    }

    void save(const MediaSelection &sel)
    {
        if (!sel.storable())
            throw std::invalid_argument("path contains a line break");
        write_atomic(file_, serialize(sel));
    }

    static MediaSelection parse(const std::string &content)
    {
        MediaSelection sel;
        std::istringstream in(content);
        std::string line;
        const std::string mk = kMasterKey;
        const std::string sk = kSlaveKey;
        while (std::getline(in, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.rfind(mk, 0) == 0)
                sel.master_path = line.substr(mk.size());
            else if (line.rfind(sk, 0) == 0)
                sel.slave_path = line.substr(sk.size());
        }
        return sel;
    }

    static std::string serialize(const MediaSelection &sel)
    {
        return std::string(kMasterKey) + sel.master_path + "\n" + kSlaveKey + sel.slave_path;
    }
};
