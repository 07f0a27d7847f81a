#pragma once

#include "SpeedTestReport.h"
#include "speedtest_protocol.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>

struct UdpWorkerArgs {
    std::string server_ip;
    uint16_t port = 0;
    uint64_t file_size = 0;
    int id = 1;                         // label in the report
    int idle_timeout_ms = 1000;         // quiet period that ends the transfer
    int rcvbuf = 4 * 1024 * 1024;       // receive buffer size
};

// Counts distinct segment indices of one transfer. The first segment fixes the
// declared total; segments disagreeing with it or out of range are rejected.
class SegmentTracker {
public:
    // true if the segment was new and counted
    bool accept(const PayloadSegment& seg);

    bool complete() const { return total && seen.size() == *total; }
    uint64_t received() const { return seen.size(); }
    uint64_t expected() const { return total ? *total : 0; }
    uint64_t bytes() const { return byte_count; }
    uint64_t duplicates() const { return dup_count; }

private:
    std::optional<uint64_t> total;
    std::unordered_set<uint64_t> seen;
    uint64_t byte_count = 0;
    uint64_t dup_count = 0;
};

// One UDP download: send a RequestPacket, collect segments until all arrived
// or the line stays quiet for idle_timeout_ms.
class UdpWorker {
public:
    explicit UdpWorker(const UdpWorkerArgs& args);

    ConnectionResult run();

private:
    UdpWorkerArgs A;
};
