#include "TcpResponder.h"

#include <arpa/inet.h>
#include <errno.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <memory>
#include <vector>

using Clock = std::chrono::steady_clock;

namespace {
constexpr int kPollTickMs = 200; // how often blocked loops re-check running
}

TcpResponder::TcpResponder(const TcpResponderArgs& args) : A(args) {}

TcpResponder::~TcpResponder() {
    stop();
}

bool TcpResponder::init() {
    if (A.chunk == 0) {
        std::cerr << "Invalid TCP chunk size: 0\n";
        return false;
    }

    listener.reset(::socket(AF_INET, SOCK_STREAM, 0));
    if (!listener.valid()) { perror("socket"); return false; }

    int opt = 1;
    if (setsockopt(listener.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        perror("setsockopt(SO_REUSEADDR)");
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(A.port);

    if (bind(listener.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        perror("bind tcp");
        return false;
    }
    if (listen(listener.get(), A.backlog) < 0) {
        perror("listen");
        return false;
    }

    local_port = bound_port(listener.get());
    if (local_port == 0) {
        perror("getsockname tcp");
        return false;
    }
    return true;
}

bool TcpResponder::start() {
    if (!listener.valid()) {
        std::cerr << "TcpResponder::start before init\n";
        return false;
    }
    if (running.exchange(true)) return true;

    acceptor = std::thread(&TcpResponder::accept_loop, this);
    std::cerr << "TCP responder listening on port " << local_port << "\n";
    return true;
}

void TcpResponder::stop() {
    running = false;
    if (acceptor.joinable()) acceptor.join();
    handlers.join_all();
}

void TcpResponder::accept_loop() {
    while (running.load()) {
        handlers.reap_finished();

        pollfd pfd{};
        pfd.fd = listener.get();
        pfd.events = POLLIN;
        int pr = ::poll(&pfd, 1, kPollTickMs);
        if (pr < 0) {
            if (errno == EINTR) continue;
            perror("poll accept");
            continue;
        }
        if (pr == 0) continue;

        sockaddr_in peer{};
        socklen_t peer_len = sizeof(peer);
        int conn_fd = ::accept(listener.get(), reinterpret_cast<sockaddr*>(&peer), &peer_len);
        if (conn_fd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) continue;
            perror("accept");
            continue;
        }

        if (A.verbose) {
            std::cerr << "New TCP client from " << addr_to_string(peer) << "\n";
        }

        // Owned by the shared_ptr until the handler adopts it
        auto conn = std::make_shared<SocketFd>(conn_fd);
        handlers.spawn([this, conn, peer] {
            SocketFd mine(conn->release());
            handle_client(mine.get(), peer);
        });
    }
}

void TcpResponder::handle_client(int fd, const sockaddr_in& peer) {
    const std::string who = addr_to_string(peer);

    auto line = read_request_line(fd, who);
    if (!line) return;

    auto size = speedtest_parse_tcp_request(*line);
    if (!size) {
        std::cerr << "TCP " << who << ": invalid file size request\n";
        return;
    }

    if (A.verbose) {
        std::cerr << "TCP " << who << ": client requested " << *size << " bytes\n";
    }

    if (!set_send_timeout(fd, A.send_timeout_ms)) {
        perror("setsockopt SO_SNDTIMEO");
    }
    if (send_payload(fd, *size, who)) {
        served_count++;
        if (A.verbose) std::cerr << "TCP " << who << ": transfer completed\n";
    }
    // Orderly close tells the client the stream is complete.
    ::shutdown(fd, SHUT_WR);
}

std::optional<std::string> TcpResponder::read_request_line(int fd, const std::string& who) {
    std::string line;
    auto deadline = Clock::now() + std::chrono::milliseconds(A.request_timeout_ms);

    while (true) {
        if (!running.load()) return std::nullopt;
        if (Clock::now() >= deadline) {
            std::cerr << "TCP " << who << ": timed out waiting for request\n";
            return std::nullopt;
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int pr = ::poll(&pfd, 1, kPollTickMs);
        if (pr < 0) {
            if (errno == EINTR) continue;
            perror("poll request");
            return std::nullopt;
        }
        if (pr == 0) continue;

        // Read one byte at a time so nothing past the newline is consumed
        char c = 0;
        ssize_t n = ::recv(fd, &c, 1, 0);
        if (n == 0) return std::nullopt; // client closed before finishing the line
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            std::cerr << "TCP " << who << ": recv request: " << std::strerror(errno) << "\n";
            return std::nullopt;
        }

        line.push_back(c);
        if (c == '\n') return line;
        if (line.size() >= A.max_request_line) {
            std::cerr << "TCP " << who << ": request line too long\n";
            return std::nullopt;
        }
    }
}

bool TcpResponder::send_payload(int fd, uint64_t size, const std::string& who) {
    std::vector<char> buf(A.chunk, 'X');
    uint64_t bytes_sent = 0;

    while (bytes_sent < size) {
        if (!running.load()) return false;

        size_t to_send = static_cast<size_t>(std::min<uint64_t>(buf.size(), size - bytes_sent));
        ssize_t n = ::send(fd, buf.data(), to_send, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::cerr << "TCP " << who << ": error sending data after " << bytes_sent
                      << " bytes: " << std::strerror(errno) << "\n";
            return false;
        }
        bytes_sent += static_cast<uint64_t>(n);
    }
    return true;
}
