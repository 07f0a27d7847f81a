#pragma once

#include <netinet/in.h>

#include <cstdint>
#include <string>

// Owns one socket descriptor; closes it on destruction.
class SocketFd {
public:
    SocketFd() = default;
    explicit SocketFd(int fd) : fd_(fd) {}
    ~SocketFd() { reset(); }

    SocketFd(const SocketFd&) = delete;
    SocketFd& operator=(const SocketFd&) = delete;

    SocketFd(SocketFd&& o) noexcept : fd_(o.release()) {}
    SocketFd& operator=(SocketFd&& o) noexcept {
        if (this != &o) reset(o.release());
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1);

private:
    int fd_ = -1;
};

std::string addr_to_string(const sockaddr_in& a);

// Fills out from a dotted IPv4 string and a host-order port.
bool make_ipv4_addr(const std::string& ip, uint16_t port, sockaddr_in& out);

// Local port a socket is bound to (host order), 0 on error.
uint16_t bound_port(int fd);

bool set_recv_timeout(int fd, int timeout_ms);
bool set_send_timeout(int fd, int timeout_ms);

// IPv4 address the host would use for outbound traffic ("0.0.0.0" if unknown).
std::string speedtest_local_ip();
