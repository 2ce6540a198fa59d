#include "sheetrun/sandbox.h"
#include "sheetrun/dep_isolator.h"
#include "sheetrun/json_util.h"
#include "sheetrun/netgate.h"
#include "sheetrun/util.h"

namespace sheetrun {

std::optional<BuildDir> resolve_build(const std::filesystem::path& builds_root, const std::string& build_ref) {
    if (build_ref.empty()) return std::nullopt;

    std::filesystem::path ref(build_ref);
    BuildDir b;
    if (ref.is_absolute()) {
        b.root = ref;
    } else {
        for (const auto& part : ref) {
            if (part == "..") return std::nullopt;
        }
        b.root = builds_root / ref;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(b.manifest(), ec)) return std::nullopt;
    return b;
}

std::vector<std::string> build_child_env(const Settings& s, const Job& job, const JobPaths& p,
                                         const BuildDir& build) {
    std::string path = "/usr/bin:/bin";
    std::error_code ec;
    if (std::filesystem::is_directory(build.env_dir() / "bin", ec)) {
        path = (build.env_dir() / "bin").string() + ":" + path;
    }

    std::vector<std::string> env = {
        "PATH=" + path,
        "PYTHONPATH=" + p.vendor_dir().string() + ":" + p.rules_dir().string(),
        "PYTHONNOUSERSITE=1",
        "HOME=" + p.root.string(),
        "LANG=C.UTF-8",
        "SHEETRUN_JOB_ID=" + job.id,
        "SHEETRUN_JOB_DIR=" + p.root.string(),
        "SHEETRUN_RULES_DIR=" + p.rules_dir().string(),
        "SHEETRUN_OUTPUT_PATH=" + p.output_file().string(),
        "SHEETRUN_RUN_REQUEST=" + p.run_request().string(),
        std::string("SHEETRUN_NETWORK=") + (job.network_access ? "1" : "0"),
    };
    if (auto in = find_input(p)) env.push_back("SHEETRUN_INPUT_PATH=" + in->string());
    if (!job.network_access) netgate_apply_env(env, s.netgate_lib);
    return env;
}

std::string SandboxLauncher::write_run_request(const Job& job, const JobPaths& p,
                                               const std::vector<std::pair<std::string, std::string>>& deps) {
    auto input = find_input(p);
    if (!input) return "input document missing";

    json_util::Doc d(json_object_new_object());
    json_object_object_add(d.root, "job_id", json_util::new_string(job.id));
    json_object_object_add(d.root, "attempt", json_object_new_int(job.attempt));
    json_object_object_add(d.root, "input", json_util::new_string(input->string()));
    json_object_object_add(d.root, "output", json_util::new_string(p.output_file().string()));
    json_object_object_add(d.root, "rules_dir", json_util::new_string(p.rules_dir().string()));
    json_object_object_add(d.root, "artifact", json_util::new_string(p.artifact().string()));
    json_object_object_add(d.root, "events", json_util::new_string(p.events().string()));
    json_object_object_add(d.root, "network_access", json_object_new_boolean(job.network_access ? 1 : 0));

    json_object* jdeps = json_object_new_array();
    for (const auto& [name, version] : deps) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "name", json_util::new_string(name));
        json_object_object_add(o, "version", json_util::new_string(version));
        json_object_array_add(jdeps, o);
    }
    json_object_object_add(d.root, "dependencies", jdeps);

    return write_atomic_file(p.run_request(), json_util::to_string(d.root, true) + "\n");
}

LaunchResult SandboxLauncher::launch(const Job& job) {
    LaunchResult r;
    const JobPaths p = job_paths(s_.jobs_dir(), job.id);

    auto fail = [&r](ErrorKind k, std::string msg) -> LaunchResult {
        r.kind = k;
        r.error = std::move(msg);
        return std::move(r);
    };

    auto build = resolve_build(s_.builds_root, job.build_ref);
    if (!build) return fail(ErrorKind::LaunchFailure, "rule package build not found: " + job.build_ref);

    std::string err = copy_tree(build->package_dir(), p.rules_dir());
    if (!err.empty()) return fail(ErrorKind::LaunchFailure, "materialize rules: " + err);

    std::vector<std::pair<std::string, std::string>> deps;
    std::error_code ec;
    if (std::filesystem::is_regular_file(p.rules_dir() / "requirements.txt", ec) &&
        !read_requirements(p.rules_dir() / "requirements.txt").empty()) {
        InstallRequest ir;
        ir.paths = p;
        ir.python = build->python();
        ir.network_access = job.network_access;
        ir.offline_cache = s_.offline_cache;
        ir.netgate_lib = s_.netgate_lib;
        ir.socket_filter = s_.netgate_seccomp;
        ir.budget = s_.budget;
        InstallResult res = install_dependencies(ir);
        if (!res.ok) return fail(ErrorKind::DependencyInstallFailure, res.error);
        deps = std::move(res.installed);
    }

    err = write_run_request(job, p, deps);
    if (!err.empty()) return fail(ErrorKind::LaunchFailure, "run request: " + err);

    SpawnSpec spec;
    spec.argv = {s_.runhost_bin.string(), "--request", p.run_request().string()};
    spec.env = build_child_env(s_, job, p, *build);
    spec.cwd = p.root;
    spec.log_path = p.child_log();
    spec.budget = s_.budget;
    spec.socket_filter = !job.network_access && s_.netgate_seccomp;

    err = spawn_child(spec, &r.child);
    if (!err.empty()) return fail(ErrorKind::LaunchFailure, "spawn failed: " + err);
    return r;
}

} // namespace sheetrun
