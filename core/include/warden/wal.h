#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace warden {

// Wal: append-only JSONL log. One record per line: <json>\n
//
// Thread-safe, with optional fsync per append. Segments are never rotated;
// the job history it holds is kept for the lifetime of the state directory.
class Wal {
public:
    explicit Wal(std::filesystem::path path);
    ~Wal();

    Wal(const Wal&) = delete;
    Wal& operator=(const Wal&) = delete;

    void set_fsync(bool enable);

    // Opens the WAL file (creates parent dirs if needed).
    // Returns empty string on success.
    std::string open();

    bool is_open() const;

    // Appends one JSON record line. A line that was torn by an earlier crash
    // is terminated first so the new record starts on its own line.
    // Returns empty string on success.
    std::string append_json_line(const std::string& json);

    long long size_bytes() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
    bool fsync_ = false;
    bool needs_newline_ = false;   // file ended without '\n' when opened
    mutable std::mutex mu_;
};

struct WalLine {
    size_t line_no{0};       // 1-based
    std::string text;        // without the trailing newline
    bool complete{true};     // false for a final line with no newline (torn write)
};

// Reads every line of a WAL file. A missing file yields an empty list.
// Returns empty string on success.
std::string read_wal_lines(const std::filesystem::path& path, std::vector<WalLine>* out);

} // namespace warden
