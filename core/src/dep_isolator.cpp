#include "sheetrun/dep_isolator.h"
#include "sheetrun/netgate.h"
#include "sheetrun/proc.h"

#include <algorithm>
#include <fstream>
#include <memory>

namespace sheetrun {

std::vector<std::string> read_requirements(const std::filesystem::path& path) {
    std::vector<std::string> out;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        size_t b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos) continue;
        size_t e = line.find_last_not_of(" \t\r");
        out.push_back(line.substr(b, e - b + 1));
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> scan_installed(const std::filesystem::path& vendor_dir) {
    std::vector<std::pair<std::string, std::string>> out;
    std::error_code ec;
    if (!std::filesystem::is_directory(vendor_dir, ec)) return out;

    const std::string suffix = ".dist-info";
    for (const auto& e : std::filesystem::directory_iterator(vendor_dir, ec)) {
        if (!e.is_directory(ec)) continue;
        std::string name = e.path().filename().string();
        if (name.size() <= suffix.size() || name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        std::string stem = name.substr(0, name.size() - suffix.size());
        // <name>-<version>; names use '_' for '-', versions never contain '-'
        auto dash = stem.rfind('-');
        if (dash == std::string::npos || dash == 0 || dash + 1 >= stem.size()) continue;
        out.emplace_back(stem.substr(0, dash), stem.substr(dash + 1));
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> pip_argv(const InstallRequest& req) {
    std::vector<std::string> argv = {
        req.python.string(), "-m", "pip", "install",
        "--target", req.paths.vendor_dir().string(),
        "--no-input", "--disable-pip-version-check",
        "-r", (req.paths.rules_dir() / "requirements.txt").string(),
    };
    if (!req.network_access) {
        argv.push_back("--no-index");
        argv.push_back("--find-links");
        argv.push_back(req.offline_cache.string());
    }
    return argv;
}

InstallResult install_dependencies(const InstallRequest& req) {
    InstallResult r;
    const char* failure = req.network_access ? kDepsFailedSummary : kDepsOfflineSummary;

    std::error_code ec;
    if (!req.network_access) {
        if (req.offline_cache.empty() || !std::filesystem::is_directory(req.offline_cache, ec)) {
            std::ofstream log(req.paths.install_log(), std::ios::app);
            log << "offline cache not available: '" << req.offline_cache.string() << "'\n";
            r.error = failure;
            return r;
        }
    }
    if (!std::filesystem::exists(req.python, ec)) {
        std::ofstream log(req.paths.install_log(), std::ios::app);
        log << "interpreter not found: " << req.python.string() << "\n";
        r.error = failure;
        return r;
    }

    std::filesystem::create_directories(req.paths.vendor_dir(), ec);
    if (ec) {
        r.error = failure;
        return r;
    }

    SpawnSpec spec;
    spec.argv = pip_argv(req);
    spec.cwd = req.paths.root;
    spec.log_path = req.paths.install_log();
    spec.budget = req.budget;
    spec.env = {
        "PATH=" + req.python.parent_path().string() + ":/usr/bin:/bin",
        "HOME=" + req.paths.root.string(),
        "LANG=C.UTF-8",
        "PIP_NO_CACHE_DIR=1",
    };
    if (!req.network_access) {
        netgate_apply_env(spec.env, req.netgate_lib);
        spec.socket_filter = req.socket_filter;
    }

    std::unique_ptr<ChildHandle> child;
    std::string err = spawn_child(spec, &child);
    if (!err.empty()) {
        std::ofstream log(req.paths.install_log(), std::ios::app);
        log << "installer launch failed: " << err << "\n";
        r.error = failure;
        return r;
    }

    WaitResult w = child->wait(req.budget.wall_clock_timeout_ms);
    if (w.timed_out || w.exit_code != 0) {
        std::ofstream log(req.paths.install_log(), std::ios::app);
        if (w.timed_out) log << "installer timed out\n";
        else if (w.term_signal) log << "installer killed by signal " << w.term_signal << "\n";
        else log << "installer exited with code " << w.exit_code << "\n";
        r.error = failure;
        return r;
    }

    r.ok = true;
    r.installed = scan_installed(req.paths.vendor_dir());
    return r;
}

} // namespace sheetrun
