#pragma once

// Network gate for job children.
//
// Primary mechanism: LD_PRELOAD of libsheetrun_netgate.so, which replaces
// socket() for AF_INET, AF_INET6 and AF_PACKET with a stub that prints
// kNetgateMessage to stderr and fails with EACCES. Unix-domain sockets work.
//
// Statically linked binaries bypass the preload. install_socket_filter()
// closes that gap with a seccomp program that returns EACCES for the same
// families; it is opt-in (SHEETRUN_NETGATE_SECCOMP=1).

#include <filesystem>
#include <string>
#include <vector>

namespace sheetrun {

inline constexpr const char* kNetgateMessage = "sheetrun: network access is disabled for this job";

// Appends LD_PRELOAD=<lib> to a KEY=VALUE environment vector. Any existing
// LD_PRELOAD entry is replaced, not chained.
void netgate_apply_env(std::vector<std::string>& env, const std::filesystem::path& lib);

// Installs the seccomp socket filter in the calling process. Requires
// PR_SET_NO_NEW_PRIVS. Uses a stack-allocated program and no allocation, so
// it is safe between fork() and execve(). Returns 0 or -1 with errno set.
int install_socket_filter() noexcept;

bool seccomp_available();

} // namespace sheetrun
