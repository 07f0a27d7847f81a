#pragma once

#include "speedtest_net.h"
#include "speedtest_protocol.h"
#include "speedtest_tasks.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <netinet/in.h>
#include <optional>
#include <string>
#include <thread>

struct TcpResponderArgs {
    uint16_t port = 0;                      // 0 = ephemeral
    int backlog = 128;
    size_t chunk = SPEEDTEST_TCP_CHUNK;     // bytes per send()
    size_t max_request_line = 32;           // digits + '\n'
    int request_timeout_ms = 5000;          // time allowed to deliver the request line
    int send_timeout_ms = 5000;             // SO_SNDTIMEO per send()
    bool verbose = false;
};

// Serves "<decimal size>\n" requests: writes that many bytes back, then closes.
// Every accepted connection is handled on its own thread.
class TcpResponder {
public:
    explicit TcpResponder(const TcpResponderArgs& args);
    ~TcpResponder();

    TcpResponder(const TcpResponder&) = delete;
    TcpResponder& operator=(const TcpResponder&) = delete;

    bool init();
    bool start();
    void stop();

    uint16_t port() const { return local_port; }
    uint64_t served() const { return served_count.load(); }

private:
    void accept_loop();
    void handle_client(int fd, const sockaddr_in& peer);
    std::optional<std::string> read_request_line(int fd, const std::string& who);
    bool send_payload(int fd, uint64_t size, const std::string& who);

private:
    TcpResponderArgs A;
    SocketFd listener;
    uint16_t local_port = 0;

    std::thread acceptor;
    std::atomic<bool> running{false};
    TaskGroup handlers;
    std::atomic<uint64_t> served_count{0};
};
