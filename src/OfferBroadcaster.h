#pragma once

#include "speedtest_net.h"
#include "speedtest_protocol.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <netinet/in.h>
#include <string>
#include <thread>
#include <vector>

struct OfferBroadcasterArgs {
    std::string broadcast_ip = SPEEDTEST_BROADCAST_IP; // destination address
    uint16_t offer_port = SPEEDTEST_OFFER_PORT;        // destination port
    uint16_t udp_port = 0;                             // advertised UDP data port
    uint16_t tcp_port = 0;                             // advertised TCP data port
    int interval_ms = 1000;                            // time between offers
};

// Sends an OfferPacket to broadcast_ip:offer_port every interval until stopped.
class OfferBroadcaster {
public:
    explicit OfferBroadcaster(const OfferBroadcasterArgs& args);
    ~OfferBroadcaster();

    OfferBroadcaster(const OfferBroadcaster&) = delete;
    OfferBroadcaster& operator=(const OfferBroadcaster&) = delete;

    bool init();
    bool start();
    void stop();

    // One offer; false (after logging) if the send failed.
    bool send_once();

    uint64_t sent() const { return sent_count.load(); }
    uint64_t failed() const { return failed_count.load(); }

private:
    void loop();

private:
    OfferBroadcasterArgs A;
    SocketFd sock;
    sockaddr_in dest{};
    std::vector<uint8_t> offer;

    std::thread worker;
    std::atomic<bool> running{false};
    std::mutex mu;
    std::condition_variable cv;

    std::atomic<uint64_t> sent_count{0};
    std::atomic<uint64_t> failed_count{0};
};
