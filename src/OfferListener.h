#pragma once

#include "speedtest_net.h"
#include "speedtest_protocol.h"

#include <cstddef>
#include <cstdint>
#include <netinet/in.h>
#include <optional>
#include <string>

struct OfferListenerArgs {
    uint16_t port = SPEEDTEST_OFFER_PORT;   // 0 = ephemeral (tests)
    std::string bind_ip = "0.0.0.0";
};

// What a client needs to reach the server that sent an offer.
struct ServerOffer {
    std::string ip;                         // sender address of the offer
    uint16_t udp_port = 0;
    uint16_t tcp_port = 0;
};

// Waits on the offer port for the first datagram that decodes as an OfferPacket.
// Several listeners may share the port on one host.
class OfferListener {
public:
    explicit OfferListener(const OfferListenerArgs& args);

    OfferListener(const OfferListener&) = delete;
    OfferListener& operator=(const OfferListener&) = delete;

    bool init();

    // Blocks until a valid offer arrives. timeout_ms < 0 waits forever;
    // otherwise returns empty once the deadline passes.
    std::optional<ServerOffer> wait_for_offer(int timeout_ms = -1);

    // Drops every datagram already queued on the socket. Returns how many.
    size_t discard_pending();

    uint16_t port() const { return local_port; }

private:
    OfferListenerArgs A;
    SocketFd sock;
    uint16_t local_port = 0;
};
