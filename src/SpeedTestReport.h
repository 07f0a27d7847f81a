#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class Transport { TCP, UDP };

const char* transport_name(Transport t);

// Outcome of one worker's request/response cycle.
struct ConnectionResult {
    Transport transport = Transport::TCP;
    int id = 0;                                  // 1-based within its transport
    bool ok = true;
    std::string error;                           // set when ok == false
    uint64_t bytes_requested = 0;
    uint64_t bytes_transferred = 0;
    std::chrono::microseconds elapsed{0};
    std::optional<uint64_t> segments_received;   // UDP only
    std::optional<uint64_t> segments_expected;   // UDP only

    double seconds() const;
    double throughput_bps() const;               // bits per second
    // received / expected for UDP; 0 when nothing declared a total, or for TCP.
    double success_rate() const;
};

struct SpeedTestReport {
    std::vector<ConnectionResult> results;       // TCP first, then UDP, each by id

    size_t count(Transport t) const;
    size_t failures() const;
    uint64_t total_bytes(Transport t) const;
};

// Thread-safe sink the workers report into; read once after all have joined.
class ResultCollector {
public:
    void add(ConnectionResult r);
    size_t size() const;
    SpeedTestReport take();

private:
    mutable std::mutex mu_;
    std::vector<ConnectionResult> results_;
};

// One line per connection, e.g.
// "TCP transfer #1 finished, total time: 0.012 seconds, total speed: 655360000.00 bits/second"
std::string format_result(const ConnectionResult& r);
