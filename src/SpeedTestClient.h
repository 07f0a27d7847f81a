#pragma once

#include "OfferListener.h"
#include "SpeedTestReport.h"

#include <cstdint>
#include <optional>
#include <string>

struct SpeedTestClientArgs {
    uint16_t offer_port = SPEEDTEST_OFFER_PORT;
    std::string bind_ip = "0.0.0.0";        // where offers are received
    uint64_t file_size = 0;                 // bytes per connection
    int tcp_count = 1;
    int udp_count = 1;
    int udp_idle_timeout_ms = 1000;
    int connect_timeout_ms = 5000;
    int io_timeout_ms = 5000;
    int udp_rcvbuf = 4 * 1024 * 1024;
    bool verbose = false;
};

// Discovers a server and runs tcp_count + udp_count concurrent downloads against it.
class SpeedTestClient {
public:
    explicit SpeedTestClient(const SpeedTestClientArgs& args);

    SpeedTestClient(const SpeedTestClient&) = delete;
    SpeedTestClient& operator=(const SpeedTestClient&) = delete;

    bool init();

    // First valid offer wins. timeout_ms < 0 blocks until one arrives.
    std::optional<ServerOffer> discover(int timeout_ms = -1);

    // Spawns one worker per connection and returns once all of them reported.
    SpeedTestReport run_test(const ServerOffer& server);

    // discover() followed by run_test(); empty if no offer arrived in time.
    std::optional<SpeedTestReport> run(int discover_timeout_ms = -1);

    uint16_t offer_port() const { return listener.port(); }

private:
    SpeedTestClientArgs A;
    OfferListener listener;
};
