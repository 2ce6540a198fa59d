#include "sheetrun/util.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

namespace sheetrun {

int64_t now_ms() {
    using namespace std::chrono;
    return (int64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string iso_from_ms(int64_t ms) {
    std::time_t t = (std::time_t)(ms / 1000);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << (ms % 1000) << "Z";
    return oss.str();
}

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

std::string gen_job_id() {
    static std::atomic<uint64_t> det_counter{0};
    const char* det = std::getenv("SHEETRUN_DETERMINISTIC_IDS");
    if (det && std::string(det) == "1") {
        std::ostringstream oss;
        oss << "job" << std::setw(8) << std::setfill('0') << ++det_counter;
        return oss.str();
    }

    uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
    uint64_t r = 0;
    try {
        std::random_device rd;
        r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
    } catch (const std::exception&) {
        r = 0x9e3779b97f4a7c15ULL;
    }
    std::mt19937_64 rng{t ^ r ^ (det_counter.fetch_add(1) << 17)};
    uint64_t a = rng();
    uint64_t b = rng();
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << a
        << std::setw(16) << std::setfill('0') << b;
    return oss.str();
}

std::string getenv_str(const char* k, const std::string& defv) {
    const char* v = std::getenv(k);
    return v ? std::string(v) : defv;
}

bool ends_with(const std::string& s, const std::string& suf) {
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

std::string slurp_file(const std::filesystem::path& p) {
    std::ifstream f(p.string(), std::ios::binary);
    if (!f) return "";
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

std::string write_atomic_file(const std::filesystem::path& dst, const std::string& body) {
    std::error_code ec;
    if (dst.has_parent_path()) std::filesystem::create_directories(dst.parent_path(), ec);
    auto tmp = dst;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return std::string("open: ") + std::strerror(errno);
    size_t off = 0;
    while (off < body.size()) {
        ssize_t w = ::write(fd, body.data() + off, body.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            std::string err = std::string("write: ") + std::strerror(errno);
            ::close(fd);
            std::filesystem::remove(tmp, ec);
            return err;
        }
        off += (size_t)w;
    }
    if (::fsync(fd) != 0) {
        std::string err = std::string("fsync: ") + std::strerror(errno);
        ::close(fd);
        std::filesystem::remove(tmp, ec);
        return err;
    }
    ::close(fd);

    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(tmp, ec2);
        return "rename: " + ec.message();
    }
    return "";
}

std::string copy_tree(const std::filesystem::path& src, const std::filesystem::path& dst) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(src, ec)) return "not a directory: " + src.string();
    fs::create_directories(dst, ec);
    if (ec) return "create_directories: " + ec.message();

    for (auto it = fs::recursive_directory_iterator(src, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        auto rel = fs::relative(entry.path(), src, ec);
        if (ec) return "relative: " + ec.message();
        auto target = dst / rel;
        if (entry.is_symlink(ec)) continue;
        if (entry.is_directory(ec)) {
            fs::create_directories(target, ec);
            if (ec) return "create_directories: " + ec.message();
        } else if (entry.is_regular_file(ec)) {
            fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing, ec);
            if (ec) return "copy " + rel.string() + ": " + ec.message();
        }
    }
    if (ec) return "walk: " + ec.message();
    return "";
}

} // namespace sheetrun
