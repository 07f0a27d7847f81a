#include "UdpWorker.h"

#include "speedtest_net.h"

#include <arpa/inet.h>
#include <errno.h>
#include <poll.h>
#include <sys/socket.h>

#include <chrono>
#include <cstdio>
#include <cstring>
#include <vector>

using Clock = std::chrono::steady_clock;

bool SegmentTracker::accept(const PayloadSegment& seg) {
    if (seg.total_segments == 0) return false;
    if (!total) total = seg.total_segments;
    if (seg.total_segments != *total) return false;
    if (seg.current_segment == 0 || seg.current_segment > *total) return false;

    if (!seen.insert(seg.current_segment).second) {
        dup_count++;
        return false;
    }
    byte_count += seg.data.size();
    return true;
}

UdpWorker::UdpWorker(const UdpWorkerArgs& args) : A(args) {}

ConnectionResult UdpWorker::run() {
    ConnectionResult r;
    r.transport = Transport::UDP;
    r.id = A.id;
    r.bytes_requested = A.file_size;

    SegmentTracker tracker;
    auto t0 = Clock::now();
    auto last = t0;

    auto finish = [&](const std::string& err) {
        // With nothing received, the whole wait counts as elapsed time.
        auto end = tracker.received() > 0 ? last : Clock::now();
        r.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(end - t0);
        r.bytes_transferred = tracker.bytes();
        r.segments_received = tracker.received();
        r.segments_expected = tracker.expected();
        if (!err.empty()) {
            r.ok = false;
            r.error = err;
        }
        return r;
    };

    sockaddr_in server{};
    if (!make_ipv4_addr(A.server_ip, A.port, server)) {
        return finish("invalid server address " + A.server_ip);
    }

    SocketFd sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock.valid()) return finish(std::string("socket: ") + std::strerror(errno));

    if (A.rcvbuf > 0 && setsockopt(sock.get(), SOL_SOCKET, SO_RCVBUF, &A.rcvbuf, sizeof(A.rcvbuf)) < 0) {
        perror("setsockopt SO_RCVBUF"); /* non-fatal */
    }

    // Associating the socket filters out datagrams from anyone but the server.
    if (::connect(sock.get(), (const sockaddr*)&server, sizeof(server)) < 0) {
        return finish(std::string("connect: ") + std::strerror(errno));
    }

    RequestPacket req;
    req.file_size = A.file_size;
    std::vector<uint8_t> pkt = speedtest_encode(req);

    t0 = Clock::now();
    last = t0;
    ssize_t n = ::send(sock.get(), pkt.data(), pkt.size(), 0);
    if (n < 0) return finish(std::string("send request: ") + std::strerror(errno));

    std::vector<uint8_t> buf(SPEEDTEST_MAX_DATAGRAM);
    auto idle = std::chrono::milliseconds(A.idle_timeout_ms);
    auto last_rx = t0; // idle timer, reset by every segment including duplicates

    while (!tracker.complete()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(last_rx + idle - Clock::now()).count();
        if (left <= 0) break; // quiet period elapsed: transfer over

        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int pr = ::poll(&pfd, 1, static_cast<int>(left));
        if (pr < 0) {
            if (errno == EINTR) continue;
            return finish(std::string("poll: ") + std::strerror(errno));
        }
        if (pr == 0) break;

        n = ::recv(sock.get(), buf.data(), buf.size(), 0);
        if (n < 0) {
            // ICMP port unreachable surfaces here on a connected UDP socket
            if (errno == EINTR || errno == EAGAIN) continue;
            return finish(std::string("recv: ") + std::strerror(errno));
        }

        auto seg = speedtest_decode_payload(buf.data(), (size_t)n);
        if (!seg) continue;

        last_rx = Clock::now();
        if (tracker.accept(*seg)) last = last_rx;
    }

    return finish("");
}
