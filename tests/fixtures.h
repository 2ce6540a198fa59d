#pragma once

// Shared on-disk fixtures: rule-package builds, input documents and a
// Settings value pointing at a scratch root.

#include "test_common.h"

#include "sheetrun/config.h"
#include "sheetrun/util.h"

#include <filesystem>
#include <string>

// Contacts CSV: one mapped email column, one mapped name column, one column
// no field claims. The secret value must never reach the artifact.
inline constexpr const char* kSecretCell = "s3cr3t-do-not-log";
inline const std::string kContactsCsv =
    "Full Name,E-Mail,Favourite Colour\n"
    "Ada Lovelace,ada@example.org,green\n"
    "Alan Turing,alan@example.org," + std::string(kSecretCell) + "\n"
    "Grace Hopper,grace@example.org,blue\n";

inline const std::string kContactsManifest =
    "{\"name\":\"contacts\",\"version\":\"1.0.0\",\"pipeline\":\"builtin.csv_mapper\","
    "\"fields\":["
    "{\"name\":\"email\",\"synonyms\":[\"e-mail\",\"mail\"],\"required\":true},"
    "{\"name\":\"name\",\"synonyms\":[\"full name\"]}"
    "],\"unmapped_prefix\":\"raw_\"}";

inline void write_file(const std::filesystem::path& p, const std::string& body) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    std::string err = sheetrun::write_atomic_file(p, body);
    if (!err.empty()) die("write " + p.string() + ": " + err);
}

// <builds_root>/<name>/package/manifest.json (+ optional requirements.txt)
inline std::filesystem::path make_build(const std::filesystem::path& builds_root, const std::string& name,
                                        const std::string& manifest, const std::string& requirements = "") {
    std::filesystem::path pkg = builds_root / name / "package";
    write_file(pkg / "manifest.json", manifest);
    if (!requirements.empty()) write_file(pkg / "requirements.txt", requirements);
    return builds_root / name;
}

// Manifest of a "command" pipeline running `script` with /bin/sh.
inline std::string command_manifest(const std::string& script) {
    std::string esc;
    for (char c : script) {
        if (c == '"' || c == '\\') esc.push_back('\\');
        esc.push_back(c);
    }
    return "{\"name\":\"cmd\",\"version\":\"0.1\",\"pipeline\":\"command\","
           "\"command\":[\"/bin/sh\",\"-c\",\"" + esc + "\"],"
           "\"fields\":[{\"name\":\"email\"}]}";
}

// Fresh scratch root with every path the supervisor needs.
inline sheetrun::Settings test_settings(const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root / "builds", ec);
    std::filesystem::create_directories(root / "docs", ec);

    sheetrun::Settings s;
    s.root = root;
    s.builds_root = root / "builds";
    s.max_concurrency = 1;
    s.queue_capacity = 1;
    s.runhost_bin = SHEETRUN_TEST_RUNHOST_BIN;
    s.netgate_lib = SHEETRUN_TEST_NETGATE_LIB;
    s.budget.cpu_seconds = 30;
    s.budget.memory_mb = 1024;
    s.budget.max_processes = 0;
    s.budget.wall_clock_timeout_ms = 20000;
    s.network_default = false;
    return s;
}
