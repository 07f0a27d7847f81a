#pragma once

#include "OfferBroadcaster.h"
#include "TcpResponder.h"
#include "UdpResponder.h"

#include <cstdint>
#include <memory>
#include <string>

struct SpeedTestServerArgs {
    std::string broadcast_ip = SPEEDTEST_BROADCAST_IP;
    uint16_t offer_port = SPEEDTEST_OFFER_PORT;
    int interval_ms = 1000;                          // offer interval
    uint16_t tcp_port = 0;                           // 0 = ephemeral
    uint16_t udp_port = 0;                           // 0 = ephemeral
    size_t segment_payload = SPEEDTEST_UDP_PAYLOAD;  // UDP data bytes per segment
    bool verbose = false;
};

// Offer broadcaster plus TCP and UDP responders, all running independently.
class SpeedTestServer {
public:
    explicit SpeedTestServer(const SpeedTestServerArgs& args);
    ~SpeedTestServer();

    SpeedTestServer(const SpeedTestServer&) = delete;
    SpeedTestServer& operator=(const SpeedTestServer&) = delete;

    bool init();
    bool start();
    void stop();

    uint16_t tcp_port() const { return tcp.port(); }
    uint16_t udp_port() const { return udp.port(); }
    const std::string& ip() const { return server_ip; }

private:
    SpeedTestServerArgs A;
    std::string server_ip;
    TcpResponder tcp;
    UdpResponder udp;
    std::unique_ptr<OfferBroadcaster> offers; // created once the data ports are known
};
