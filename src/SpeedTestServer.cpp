#include "SpeedTestServer.h"

#include <iostream>

namespace {

TcpResponderArgs tcp_args(const SpeedTestServerArgs& a) {
    TcpResponderArgs t;
    t.port = a.tcp_port;
    t.verbose = a.verbose;
    return t;
}

UdpResponderArgs udp_args(const SpeedTestServerArgs& a) {
    UdpResponderArgs u;
    u.port = a.udp_port;
    u.segment_payload = a.segment_payload;
    u.verbose = a.verbose;
    return u;
}

} // namespace

SpeedTestServer::SpeedTestServer(const SpeedTestServerArgs& args)
    : A(args), tcp(tcp_args(args)), udp(udp_args(args)) {}

SpeedTestServer::~SpeedTestServer() {
    stop();
}

bool SpeedTestServer::init() {
    server_ip = speedtest_local_ip();

    if (!tcp.init()) return false;
    if (!udp.init()) return false;

    OfferBroadcasterArgs b;
    b.broadcast_ip = A.broadcast_ip;
    b.offer_port = A.offer_port;
    b.interval_ms = A.interval_ms;
    b.tcp_port = tcp.port();
    b.udp_port = udp.port();

    offers = std::make_unique<OfferBroadcaster>(b);
    return offers->init();
}

bool SpeedTestServer::start() {
    if (!offers) {
        std::cerr << "SpeedTestServer::start before init\n";
        return false;
    }
    // Responders first so the first offer never points at a closed port.
    if (!tcp.start()) return false;
    if (!udp.start()) { tcp.stop(); return false; }
    if (!offers->start()) { udp.stop(); tcp.stop(); return false; }

    std::cerr << "Server started, listening on IP address " << server_ip
              << " (tcp=" << tcp.port() << ", udp=" << udp.port() << ")\n";
    return true;
}

void SpeedTestServer::stop() {
    if (offers) offers->stop();
    udp.stop();
    tcp.stop();
}
