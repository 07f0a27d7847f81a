#include "OfferListener.h"

#include <arpa/inet.h>
#include <errno.h>
#include <poll.h>
#include <sys/socket.h>

#include <chrono>
#include <cstdio>
#include <iostream>

using Clock = std::chrono::steady_clock;

OfferListener::OfferListener(const OfferListenerArgs& args) : A(args) {}

bool OfferListener::init() {
    sock.reset(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (!sock.valid()) { perror("socket"); return false; }

    int yes = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
        perror("setsockopt SO_REUSEADDR");
        return false;
    }
    if (setsockopt(sock.get(), SOL_SOCKET, SO_BROADCAST, &yes, sizeof(yes)) < 0) {
        perror("setsockopt SO_BROADCAST");
        return false;
    }

    sockaddr_in local{};
    if (!make_ipv4_addr(A.bind_ip, A.port, local)) {
        std::cerr << "Invalid listen IP: " << A.bind_ip << "\n";
        return false;
    }
    if (bind(sock.get(), (sockaddr*)&local, sizeof(local)) < 0) {
        perror("bind offer port");
        return false;
    }

    local_port = bound_port(sock.get());
    return local_port != 0;
}

std::optional<ServerOffer> OfferListener::wait_for_offer(int timeout_ms) {
    if (!sock.valid()) {
        std::cerr << "OfferListener::wait_for_offer before init\n";
        return std::nullopt;
    }

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);
    uint8_t buf[1024];

    while (true) {
        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            if (left <= 0) return std::nullopt;
            wait_ms = static_cast<int>(left);
        }

        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int pr = ::poll(&pfd, 1, wait_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            perror("poll offer");
            return std::nullopt;
        }
        if (pr == 0) continue;

        sockaddr_in peer{};
        socklen_t alen = sizeof(peer);
        ssize_t n = recvfrom(sock.get(), buf, sizeof(buf), 0, (sockaddr*)&peer, &alen);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            perror("recvfrom offer");
            return std::nullopt;
        }

        auto offer = speedtest_decode_offer(buf, (size_t)n);
        if (!offer) continue; // not ours, keep listening

        char ip[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));

        ServerOffer out;
        out.ip = ip;
        out.udp_port = offer->udp_port;
        out.tcp_port = offer->tcp_port;
        return out;
    }
}

size_t OfferListener::discard_pending() {
    if (!sock.valid()) return 0;

    uint8_t buf[1024];
    size_t dropped = 0;
    while (true) {
        ssize_t n = recv(sock.get(), buf, sizeof(buf), MSG_DONTWAIT);
        if (n >= 0) {
            dropped++;
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) perror("recv discard offer");
        return dropped;
    }
}
