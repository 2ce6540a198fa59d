#include "sheetrun/wal.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace sheetrun {

static std::string write_all(int fd, const char* p, size_t len) {
    size_t off = 0;
    while (off < len) {
        ssize_t w = ::write(fd, p + off, len - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return std::string("write: ") + std::strerror(errno);
        }
        off += (size_t)w;
    }
    return "";
}

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

std::string Wal::open_locked() {
    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return std::string("create_directories: ") + ec.message();
    }
    fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) return std::string("open: ") + std::strerror(errno);
    return "";
}

std::string Wal::append_json_line(const std::string& json) {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ < 0) {
        std::string err = open_locked();
        if (!err.empty()) return err;
    }

    std::string line = json;
    if (line.empty() || line.back() != '\n') line.push_back('\n');

    std::string err = write_all(fd_, line.data(), line.size());
    if (!err.empty()) return err;

    if (fsync_) {
        if (::fsync(fd_) != 0) {
            return std::string("fsync: ") + std::strerror(errno);
        }
    }
    return "";
}

std::string Wal::compact(const std::vector<std::string>& lines) {
    std::lock_guard<std::mutex> lk(mu_);

    std::error_code mk_ec;
    if (!path_.parent_path().empty()) std::filesystem::create_directories(path_.parent_path(), mk_ec);
    if (mk_ec) return std::string("create_directories: ") + mk_ec.message();

    auto tmp = path_;
    tmp += ".compact";
    int tfd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (tfd < 0) return std::string("open compact: ") + std::strerror(errno);

    for (const auto& l : lines) {
        std::string line = l;
        if (line.empty() || line.back() != '\n') line.push_back('\n');
        std::string err = write_all(tfd, line.data(), line.size());
        if (!err.empty()) {
            ::close(tfd);
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            return err;
        }
    }
    if (::fsync(tfd) != 0) {
        std::string err = std::string("fsync: ") + std::strerror(errno);
        ::close(tfd);
        return err;
    }
    ::close(tfd);

    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        std::string err = "compact rename: " + ec.message();
        (void)open_locked();
        return err;
    }

    // fsync parent directory for rename durability
    int dir_fd = ::open(path_.parent_path().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd >= 0) { ::fsync(dir_fd); ::close(dir_fd); }

    return open_locked();
}

std::vector<std::string> Wal::read_lines(const std::filesystem::path& path) {
    std::vector<std::string> out;
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) return out;
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) break;  // torn tail
        if (nl > start) out.emplace_back(content.substr(start, nl - start));
        start = nl + 1;
    }
    return out;
}

} // namespace sheetrun
