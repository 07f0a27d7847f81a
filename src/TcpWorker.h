#pragma once

#include "SpeedTestReport.h"
#include "speedtest_protocol.h"

#include <cstddef>
#include <cstdint>
#include <string>

struct TcpWorkerArgs {
    std::string server_ip;
    uint16_t port = 0;
    uint64_t file_size = 0;
    int id = 1;                                 // label in the report
    int connect_timeout_ms = 5000;
    int io_timeout_ms = 5000;                   // SO_RCVTIMEO / SO_SNDTIMEO
    size_t recv_chunk = SPEEDTEST_TCP_CHUNK;
};

// One TCP download: connect, send the size line, read to end-of-stream.
class TcpWorker {
public:
    explicit TcpWorker(const TcpWorkerArgs& args);

    ConnectionResult run();

private:
    TcpWorkerArgs A;
};
