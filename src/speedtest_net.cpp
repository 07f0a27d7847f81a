#include "speedtest_net.h"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <sstream>

void SocketFd::reset(int fd) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
}

std::string addr_to_string(const sockaddr_in& a) {
    char buf[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &a.sin_addr, buf, sizeof(buf));
    std::ostringstream oss;
    oss << buf << ":" << ntohs(a.sin_port);
    return oss.str();
}

bool make_ipv4_addr(const std::string& ip, uint16_t port, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    return inet_pton(AF_INET, ip.c_str(), &out.sin_addr) == 1;
}

uint16_t bound_port(int fd) {
    sockaddr_in sa{};
    socklen_t sl = sizeof(sa);
    if (getsockname(fd, (sockaddr*)&sa, &sl) == 0) return ntohs(sa.sin_port);
    return 0;
}

static bool set_timeout(int fd, int opt, int timeout_ms) {
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    return setsockopt(fd, SOL_SOCKET, opt, &tv, sizeof(tv)) == 0;
}

bool set_recv_timeout(int fd, int timeout_ms) {
    return set_timeout(fd, SO_RCVTIMEO, timeout_ms);
}

bool set_send_timeout(int fd, int timeout_ms) {
    return set_timeout(fd, SO_SNDTIMEO, timeout_ms);
}

std::string speedtest_local_ip() {
    // Connecting a UDP socket sends nothing; it only makes the kernel pick a route.
    SocketFd s(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!s.valid()) return "0.0.0.0";

    sockaddr_in probe{};
    if (!make_ipv4_addr("8.8.8.8", 80, probe)) return "0.0.0.0";
    if (::connect(s.get(), (sockaddr*)&probe, sizeof(probe)) < 0) return "0.0.0.0";

    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (getsockname(s.get(), (sockaddr*)&local, &len) < 0) return "0.0.0.0";

    char buf[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf));
    return buf;
}
