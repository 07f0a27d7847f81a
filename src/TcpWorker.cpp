#include "TcpWorker.h"

#include "speedtest_net.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>

#include <chrono>
#include <cstring>
#include <vector>

using Clock = std::chrono::steady_clock;

namespace {

std::string errno_text(const char* what, int err) {
    return std::string(what) + ": " + std::strerror(err);
}

// Connects with a bounded wait and leaves the socket in blocking mode.
// Returns an empty string on success, otherwise the reason.
std::string connect_with_timeout(int sock, const sockaddr_in& addr, int timeout_ms) {
    int flags = ::fcntl(sock, F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock, F_SETFL, flags | O_NONBLOCK) < 0) {
        return errno_text("fcntl(O_NONBLOCK)", errno);
    }

    int ret = ::connect(sock, (const sockaddr*)&addr, sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        return errno_text("connect", errno);
    }

    if (ret < 0) {
        pollfd pfd{};
        pfd.fd = sock;
        pfd.events = POLLOUT;

        int pr;
        do {
            pr = ::poll(&pfd, 1, timeout_ms);
        } while (pr < 0 && errno == EINTR);

        if (pr == 0) return "connect timeout";
        if (pr < 0) return errno_text("poll", errno);

        int so_error = 0;
        socklen_t slen = sizeof(so_error);
        if (::getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &slen) < 0) {
            return errno_text("getsockopt(SO_ERROR)", errno);
        }
        if (so_error != 0) return errno_text("connect", so_error);
    }

    if (::fcntl(sock, F_SETFL, flags) < 0) {
        return errno_text("fcntl(restore)", errno);
    }
    return "";
}

} // namespace

TcpWorker::TcpWorker(const TcpWorkerArgs& args) : A(args) {}

ConnectionResult TcpWorker::run() {
    ConnectionResult r;
    r.transport = Transport::TCP;
    r.id = A.id;
    r.bytes_requested = A.file_size;

    auto t0 = Clock::now();
    auto finish = [&](const std::string& err) {
        r.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - t0);
        if (!err.empty()) {
            r.ok = false;
            r.error = err;
        }
        return r;
    };

    sockaddr_in addr{};
    if (!make_ipv4_addr(A.server_ip, A.port, addr)) {
        return finish("invalid server address " + A.server_ip);
    }

    SocketFd sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock.valid()) return finish(errno_text("socket", errno));

    std::string err = connect_with_timeout(sock.get(), addr, A.connect_timeout_ms);
    if (!err.empty()) return finish(err);

    if (!set_recv_timeout(sock.get(), A.io_timeout_ms) || !set_send_timeout(sock.get(), A.io_timeout_ms)) {
        return finish(errno_text("setsockopt(timeout)", errno));
    }

    const std::string line = speedtest_format_tcp_request(A.file_size);
    size_t sent = 0;
    while (sent < line.size()) {
        ssize_t n = ::send(sock.get(), line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return finish(errno_text("send request", errno));
        }
        sent += static_cast<size_t>(n);
    }

    std::vector<char> buf(A.recv_chunk > 0 ? A.recv_chunk : SPEEDTEST_TCP_CHUNK);
    while (true) {
        ssize_t n = ::recv(sock.get(), buf.data(), buf.size(), 0);
        if (n > 0) {
            r.bytes_transferred += static_cast<uint64_t>(n);
            continue;
        }
        if (n == 0) break; // server closed: transfer complete
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return finish("receive timeout");
        return finish(errno_text("recv", errno));
    }

    if (r.bytes_transferred != A.file_size) {
        return finish("short transfer: " + std::to_string(r.bytes_transferred) + " of "
                      + std::to_string(A.file_size) + " bytes");
    }
    return finish("");
}
