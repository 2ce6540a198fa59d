#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace sheetrun {

// Wal: append-only JSONL log.
//
// Each append writes a single line: <json>\n with one write(2) on an O_APPEND
// descriptor. A torn last line (crash mid-write) is skipped by read_lines().
// compact() replaces the file with a given set of lines atomically.
//
// Thread-safe, with optional fsync per append.
class Wal {
public:
    explicit Wal(std::filesystem::path path);
    ~Wal();

    Wal(const Wal&) = delete;
    Wal& operator=(const Wal&) = delete;

    void set_fsync(bool enable);

    // Appends one JSON record line (json + '\n'), opening the file and its
    // parent directories on first use. Returns empty string on success.
    std::string append_json_line(const std::string& json);

    // Rewrites the log to exactly `lines` (tmp file + rename), then reopens.
    std::string compact(const std::vector<std::string>& lines);

    const std::filesystem::path& path() const { return path_; }

    // Complete lines of a WAL file, oldest first. Missing file -> empty.
    static std::vector<std::string> read_lines(const std::filesystem::path& path);

private:
    std::filesystem::path path_;
    int fd_ = -1;
    bool fsync_ = false;
    std::mutex mu_;

    std::string open_locked();
};

} // namespace sheetrun
