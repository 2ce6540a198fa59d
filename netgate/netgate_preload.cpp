#include "sheetrun/netgate.h"

#include <dlfcn.h>
#include <errno.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

// LD_PRELOAD shim loaded into offline jobs. Interposes socket() and refuses
// the network families; everything else goes to the real libc symbol.

namespace {

using SocketFn = int (*)(int, int, int);

SocketFn real_socket() {
    static SocketFn fn = reinterpret_cast<SocketFn>(dlsym(RTLD_NEXT, "socket"));
    return fn;
}

bool is_network_family(int domain) {
    return domain == AF_INET || domain == AF_INET6 || domain == AF_PACKET;
}

void report_denied() {
    // No stdio: this may run before the host program has set anything up.
    const size_t n = strlen(sheetrun::kNetgateMessage);
    ssize_t w = ::write(2, sheetrun::kNetgateMessage, n);
    if (w == (ssize_t)n) w = ::write(2, "\n", 1);
    (void)w;
}

} // namespace

extern "C"
[[gnu::visibility("default")]]
int socket(int domain, int type, int protocol) {
    if (is_network_family(domain)) {
        report_denied();
        errno = EACCES;
        return -1;
    }
    SocketFn fn = real_socket();
    if (!fn) {
        errno = ENOSYS;
        return -1;
    }
    return fn(domain, type, protocol);
}
