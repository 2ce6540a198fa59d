#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace sheetrun {

int64_t now_ms();
std::string iso_from_ms(int64_t ms);   // "2026-01-02T03:04:05.678Z"
void sleep_ms(int ms);

// 32 hex chars, random unless SHEETRUN_DETERMINISTIC_IDS=1 (tests).
std::string gen_job_id();

std::string getenv_str(const char* k, const std::string& defv = "");

bool ends_with(const std::string& s, const std::string& suf);
std::string slurp_file(const std::filesystem::path& p);

// Write to <dst>.tmp, fsync, rename over dst. Returns empty string on success.
std::string write_atomic_file(const std::filesystem::path& dst, const std::string& body);

// Recursive copy of a directory tree (regular files and directories only;
// symlinks are skipped so a package cannot point outside its own tree).
std::string copy_tree(const std::filesystem::path& src, const std::filesystem::path& dst);

} // namespace sheetrun
