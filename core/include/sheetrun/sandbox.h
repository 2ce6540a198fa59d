#pragma once

// Sandbox launcher: turns a Running job into a child process.
//
// launch() materializes the rule package into rules/, installs declared
// dependencies, writes logs/run_request.json, builds the child environment
// from scratch and spawns the runhost under the resource budget and the
// network gate. Any failure before the child runs is returned synchronously
// and no process is left behind.

#include "sheetrun/config.h"
#include "sheetrun/job_dir.h"
#include "sheetrun/proc.h"
#include "sheetrun/types.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sheetrun {

// A rule-package build on disk: package/manifest.json plus an optional env/
// interpreter environment.
struct BuildDir {
    std::filesystem::path root;

    std::filesystem::path package_dir() const { return root / "package"; }
    std::filesystem::path manifest() const { return root / "package" / "manifest.json"; }
    std::filesystem::path env_dir() const { return root / "env"; }
    std::filesystem::path python() const { return root / "env" / "bin" / "python"; }
};

// Absolute references are used as is; relative ones resolve under
// builds_root and may not contain "..".
std::optional<BuildDir> resolve_build(const std::filesystem::path& builds_root, const std::string& build_ref);

struct LaunchResult {
    std::unique_ptr<ChildHandle> child;
    ErrorKind kind{ErrorKind::None};
    std::string error;

    bool ok() const { return child != nullptr; }
};

// Complete environment of the child. Nothing is copied from the supervisor.
std::vector<std::string> build_child_env(const Settings& s, const Job& job, const JobPaths& p,
                                         const BuildDir& build);

class SandboxLauncher {
public:
    explicit SandboxLauncher(const Settings& s) : s_(s) {}

    LaunchResult launch(const Job& job);

private:
    std::string write_run_request(const Job& job, const JobPaths& p,
                                  const std::vector<std::pair<std::string, std::string>>& deps);

    const Settings& s_;
};

} // namespace sheetrun
