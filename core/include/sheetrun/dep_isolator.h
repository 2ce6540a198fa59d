#pragma once
#include "sheetrun/job_dir.h"
#include "sheetrun/resource_limits.h"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace sheetrun {

inline constexpr const char* kDepsOfflineSummary = "dependencies unavailable offline";
inline constexpr const char* kDepsFailedSummary = "dependency installation failed";

struct InstallRequest {
    JobPaths paths;
    std::filesystem::path python;          // <build>/env/bin/python
    bool network_access{false};
    std::filesystem::path offline_cache;   // pip --find-links, used when offline
    std::filesystem::path netgate_lib;
    bool socket_filter{false};
    ResourceBudget budget;
};

struct InstallResult {
    bool ok{false};
    std::string error;                     // short summary, raw output is in logs/install.log
    std::vector<std::pair<std::string, std::string>> installed;   // name, version
};

// Non-empty, non-comment lines of a requirements file.
std::vector<std::string> read_requirements(const std::filesystem::path& path);

// Packages found in `vendor_dir` (*.dist-info), sorted by name.
std::vector<std::pair<std::string, std::string>> scan_installed(const std::filesystem::path& vendor_dir);

// The installer command line for `req`, without running it.
std::vector<std::string> pip_argv(const InstallRequest& req);

// Installs rules/requirements.txt into rules/vendor/ with the build's own
// interpreter, as a sandboxed subprocess under the job budget. Offline
// installs only read from the local cache and run behind the network gate.
InstallResult install_dependencies(const InstallRequest& req);

} // namespace sheetrun
