#include "UdpResponder.h"

#include <arpa/inet.h>
#include <errno.h>
#include <poll.h>
#include <sys/socket.h>

#include <cstdio>
#include <cstring>
#include <iostream>
#include <vector>

UdpResponder::UdpResponder(const UdpResponderArgs& args) : A(args) {}

UdpResponder::~UdpResponder() {
    stop();
}

bool UdpResponder::init() {
    if (A.segment_payload == 0 || A.segment_payload > SPEEDTEST_MAX_DATAGRAM - SPEEDTEST_PAYLOAD_HEADER) {
        std::cerr << "Invalid UDP segment payload: " << A.segment_payload << "\n";
        return false;
    }

    sock.reset(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock.valid()) { perror("socket"); return false; }

    if (A.sndbuf > 0 && setsockopt(sock.get(), SOL_SOCKET, SO_SNDBUF, &A.sndbuf, sizeof(A.sndbuf)) < 0) {
        perror("setsockopt SO_SNDBUF"); /* non-fatal */
    }

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = htons(A.port);
    if (bind(sock.get(), (sockaddr*)&local, sizeof(local)) < 0) {
        perror("bind udp");
        return false;
    }

    local_port = bound_port(sock.get());
    if (local_port == 0) {
        perror("getsockname udp");
        return false;
    }
    return true;
}

bool UdpResponder::start() {
    if (!sock.valid()) {
        std::cerr << "UdpResponder::start before init\n";
        return false;
    }
    if (running.exchange(true)) return true;

    receiver = std::thread(&UdpResponder::recv_loop, this);
    std::cerr << "UDP responder listening on port " << local_port << "\n";
    return true;
}

void UdpResponder::stop() {
    running = false;
    if (receiver.joinable()) receiver.join();
    senders.join_all();
}

void UdpResponder::recv_loop() {
    std::vector<uint8_t> buf(2048);

    while (running.load()) {
        senders.reap_finished();

        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int pr = ::poll(&pfd, 1, 200);
        if (pr < 0) {
            if (errno == EINTR) continue;
            perror("poll udp");
            continue;
        }
        if (pr == 0) continue;

        sockaddr_in peer{};
        socklen_t alen = sizeof(peer);
        ssize_t n = recvfrom(sock.get(), buf.data(), buf.size(), 0, (sockaddr*)&peer, &alen);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            perror("recvfrom request");
            continue;
        }

        auto req = speedtest_decode_request(buf.data(), (size_t)n);
        if (!req) continue;

        if (A.verbose) {
            std::cerr << "UDP: request from " << addr_to_string(peer)
                      << ", file_size=" << req->file_size << "\n";
        }

        uint64_t file_size = req->file_size;
        senders.spawn([this, peer, file_size] { send_segments(peer, file_size); });
    }
}

void UdpResponder::send_segments(const sockaddr_in& to, uint64_t file_size) {
    const uint64_t total = speedtest_segment_count(file_size, A.segment_payload);

    // Header is rewritten per segment; the dummy data never changes.
    std::vector<uint8_t> pkt(SPEEDTEST_PAYLOAD_HEADER + A.segment_payload, 'Y');

    for (uint64_t seg = 1; seg <= total; ++seg) {
        if (!running.load()) return;

        size_t data_len = speedtest_segment_data_size(seg, file_size, A.segment_payload);
        speedtest_write_payload_header(total, seg, pkt.data());

        size_t len = SPEEDTEST_PAYLOAD_HEADER + data_len;
        ssize_t n = sendto(sock.get(), pkt.data(), len, 0, (const sockaddr*)&to, sizeof(to));
        if (n < 0) {
            if (errno == EINTR) { --seg; continue; }
            std::cerr << "UDP send error to " << addr_to_string(to) << " at segment " << seg
                      << "/" << total << ": " << std::strerror(errno) << "\n";
            return;
        }
    }

    transfer_count++;
    if (A.verbose) {
        std::cerr << "UDP: transfer to " << addr_to_string(to) << " completed ("
                  << total << " segments)\n";
    }
}
