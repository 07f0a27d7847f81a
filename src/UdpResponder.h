#pragma once

#include "speedtest_net.h"
#include "speedtest_protocol.h"
#include "speedtest_tasks.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <netinet/in.h>
#include <thread>

struct UdpResponderArgs {
    uint16_t port = 0;                          // 0 = ephemeral
    size_t segment_payload = SPEEDTEST_UDP_PAYLOAD;
    int sndbuf = 4 * 1024 * 1024;               // send buffer size
    bool verbose = false;
};

// Answers each RequestPacket with ceil(file_size / segment_payload) PayloadSegments,
// sent from the bound socket to the requester. Each request gets its own sender thread.
class UdpResponder {
public:
    explicit UdpResponder(const UdpResponderArgs& args);
    ~UdpResponder();

    UdpResponder(const UdpResponder&) = delete;
    UdpResponder& operator=(const UdpResponder&) = delete;

    bool init();
    bool start();
    void stop();

    uint16_t port() const { return local_port; }
    uint64_t transfers() const { return transfer_count.load(); }

private:
    void recv_loop();
    void send_segments(const sockaddr_in& to, uint64_t file_size);

private:
    UdpResponderArgs A;
    SocketFd sock;
    uint16_t local_port = 0;

    std::thread receiver;
    std::atomic<bool> running{false};
    TaskGroup senders;
    std::atomic<uint64_t> transfer_count{0};
};
