#include "platform/linux/ifaddrs_connectivity.hpp"

#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <print>
#include <sys/socket.h>

bool IfaddrsConnectivity::has_active_connection() const {
    ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) < 0) {
        std::println(stderr, "net: getifaddrs failed: {}", std::strerror(errno));
        return false;
    }

    bool connected = false;
    for (auto* ifa = addrs; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        if (!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_RUNNING)) continue;

        int family = ifa->ifa_addr->sa_family;
        if (family == AF_INET) {
            connected = true;
            break;
        }
        if (family == AF_INET6) {
            auto* a6 = reinterpret_cast<sockaddr_in6*>(ifa->ifa_addr);
            // Link-local alone does not reach anything useful.
            if (!IN6_IS_ADDR_LINKLOCAL(&a6->sin6_addr)) {
                connected = true;
                break;
            }
        }
    }

    freeifaddrs(addrs);
    return connected;
}
