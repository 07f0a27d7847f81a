#include "OfferBroadcaster.h"

#include <arpa/inet.h>
#include <errno.h>
#include <sys/socket.h>

#include <chrono>
#include <cstdio>
#include <iostream>

OfferBroadcaster::OfferBroadcaster(const OfferBroadcasterArgs& args) : A(args) {}

OfferBroadcaster::~OfferBroadcaster() {
    stop();
}

bool OfferBroadcaster::init() {
    sock.reset(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (!sock.valid()) { perror("socket"); return false; }

    int yes = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_BROADCAST, &yes, sizeof(yes)) < 0) {
        perror("setsockopt SO_BROADCAST");
        return false;
    }

    if (!make_ipv4_addr(A.broadcast_ip, A.offer_port, dest)) {
        std::cerr << "Invalid broadcast IP: " << A.broadcast_ip << "\n";
        return false;
    }

    OfferPacket p;
    p.udp_port = A.udp_port;
    p.tcp_port = A.tcp_port;
    offer = speedtest_encode(p);
    return true;
}

bool OfferBroadcaster::start() {
    if (!sock.valid()) {
        std::cerr << "OfferBroadcaster::start before init\n";
        return false;
    }
    if (running.exchange(true)) return true;

    worker = std::thread(&OfferBroadcaster::loop, this);
    std::cerr << "Broadcasting offers to " << addr_to_string(dest)
              << " every " << A.interval_ms << " ms (udp=" << A.udp_port
              << ", tcp=" << A.tcp_port << ")\n";
    return true;
}

void OfferBroadcaster::stop() {
    {
        std::lock_guard<std::mutex> lock(mu);
        running = false;
    }
    cv.notify_all();
    if (worker.joinable()) worker.join();
}

bool OfferBroadcaster::send_once() {
    ssize_t n = sendto(sock.get(), offer.data(), offer.size(), 0,
                       (const sockaddr*)&dest, sizeof(dest));
    if (n < 0) {
        perror("sendto offer");
        failed_count++;
        return false;
    }
    if ((size_t)n != offer.size()) {
        std::cerr << "Partial offer send: sent=" << n << " expected=" << offer.size() << "\n";
        failed_count++;
        return false;
    }
    sent_count++;
    return true;
}

void OfferBroadcaster::loop() {
    // A failed send is retried on the next tick.
    while (running.load()) {
        send_once();

        std::unique_lock<std::mutex> lock(mu);
        cv.wait_for(lock, std::chrono::milliseconds(A.interval_ms),
                    [this] { return !running.load(); });
    }
}
