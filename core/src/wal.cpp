#include "warden/wal.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace warden {

namespace {

std::string write_all(int fd, const char* p, size_t len) {
    size_t off = 0;
    while (off < len) {
        ssize_t w = ::write(fd, p + off, len - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return std::string("write: ") + std::strerror(errno);
        }
        off += static_cast<size_t>(w);
    }
    return "";
}

bool ends_without_newline(int fd) {
    struct stat st{};
    if (::fstat(fd, &st) != 0 || st.st_size == 0) return false;
    char c = 0;
    if (::pread(fd, &c, 1, st.st_size - 1) != 1) return false;
    return c != '\n';
}

} // namespace

Wal::Wal(std::filesystem::path path) : path_(std::move(path)) {}

Wal::~Wal() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void Wal::set_fsync(bool enable) {
    std::lock_guard<std::mutex> lk(mu_);
    fsync_ = enable;
}

std::string Wal::open() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) return "";

    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return std::string("create_directories: ") + ec.message();
    }

    // O_RDWR so the tail byte can be inspected; O_APPEND keeps writes at the end.
    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_APPEND | O_CLOEXEC, 0600);
    if (fd_ < 0) {
        return std::string("open: ") + std::strerror(errno);
    }
    needs_newline_ = ends_without_newline(fd_);
    return "";
}

bool Wal::is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return fd_ >= 0;
}

std::string Wal::append_json_line(const std::string& json) {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ < 0) return "wal not open";

    std::string line;
    line.reserve(json.size() + 2);
    if (needs_newline_) line.push_back('\n');
    line += json;
    if (line.empty() || line.back() != '\n') line.push_back('\n');

    std::string err = write_all(fd_, line.data(), line.size());
    if (!err.empty()) return err;
    needs_newline_ = false;

    if (fsync_) {
        if (::fsync(fd_) != 0) {
            return std::string("fsync: ") + std::strerror(errno);
        }
    }
    return "";
}

long long Wal::size_bytes() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ < 0) {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) return 0;
        return (long long)std::filesystem::file_size(path_, ec);
    }
    struct stat st{};
    if (::fstat(fd_, &st) != 0) return -1;
    return (long long)st.st_size;
}

std::string read_wal_lines(const std::filesystem::path& path, std::vector<WalLine>* out) {
    out->clear();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return "";

    std::ifstream in(path, std::ios::binary);
    if (!in) return "cannot open " + path.string();

    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return "read failed: " + path.string();

    size_t start = 0;
    size_t line_no = 0;
    while (start < data.size()) {
        size_t nl = data.find('\n', start);
        WalLine l;
        l.line_no = ++line_no;
        if (nl == std::string::npos) {
            l.text = data.substr(start);
            l.complete = false;
            out->push_back(std::move(l));
            break;
        }
        l.text = data.substr(start, nl - start);
        out->push_back(std::move(l));
        start = nl + 1;
    }
    return "";
}

} // namespace warden
