#include "sheetrun/netgate.h"

#include <cerrno>
#include <cstddef>
#include <cstdint>

#if defined(__linux__)
  #include <linux/audit.h>
  #include <linux/filter.h>
  #include <linux/seccomp.h>
  #include <sys/prctl.h>
  #include <sys/socket.h>
#endif

#if defined(__x86_64__)
  #define SHEETRUN_AUDIT_ARCH AUDIT_ARCH_X86_64
  #define SHEETRUN_NR_SOCKET 41
#elif defined(__aarch64__)
  #define SHEETRUN_AUDIT_ARCH AUDIT_ARCH_AARCH64
  #define SHEETRUN_NR_SOCKET 198
#else
  #define SHEETRUN_AUDIT_ARCH 0
  #define SHEETRUN_NR_SOCKET 0
#endif

#define BPF_STMT_SC(code, k) { (unsigned short)(code), 0, 0, (unsigned int)(k) }
#define BPF_JUMP_SC(code, k, jt, jf) { (unsigned short)(code), (unsigned char)(jt), (unsigned char)(jf), (unsigned int)(k) }

namespace sheetrun {

void netgate_apply_env(std::vector<std::string>& env, const std::filesystem::path& lib) {
    for (auto it = env.begin(); it != env.end();) {
        if (it->rfind("LD_PRELOAD=", 0) == 0) it = env.erase(it);
        else ++it;
    }
    env.push_back("LD_PRELOAD=" + lib.string());
}

#if defined(__linux__) && SHEETRUN_AUDIT_ARCH != 0

int install_socket_filter() noexcept {
    // [0] load arch
    // [1] arch ok -> [3]
    // [2] allow (foreign arch: leave it to the preload)
    // [3] load nr
    // [4] nr == socket -> [5] else allow
    // [5] load args[0] (domain)
    // [6..8] domain in {INET, INET6, PACKET} -> deny
    // [9] allow
    // [10] deny with EACCES
    struct sock_filter filter[] = {
        BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)),
        BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, SHEETRUN_AUDIT_ARCH, 1, 0),
        BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW),
        BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)),
        BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, SHEETRUN_NR_SOCKET, 0, 4),
        BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args)),
        BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, AF_INET, 3, 0),
        BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, AF_INET6, 2, 0),
        BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, AF_PACKET, 1, 0),
        BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW),
        BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EACCES & SECCOMP_RET_DATA)),
    };

    struct sock_fprog prog = {};
    prog.len = (unsigned short)(sizeof(filter) / sizeof(filter[0]));
    prog.filter = filter;

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) return -1;
    return 0;
}

bool seccomp_available() {
    // 0: available and not active, 2: filter mode active
    int ret = prctl(PR_GET_SECCOMP, 0, 0, 0, 0);
    return ret >= 0;
}

#else

int install_socket_filter() noexcept {
    errno = ENOSYS;
    return -1;
}

bool seccomp_available() {
    return false;
}

#endif

} // namespace sheetrun
