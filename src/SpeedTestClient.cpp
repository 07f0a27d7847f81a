#include "SpeedTestClient.h"

#include "TcpWorker.h"
#include "UdpWorker.h"
#include "speedtest_tasks.h"

#include <iostream>
#include <system_error>

namespace {

OfferListenerArgs listener_args(const SpeedTestClientArgs& a) {
    OfferListenerArgs l;
    l.port = a.offer_port;
    l.bind_ip = a.bind_ip;
    return l;
}

ConnectionResult spawn_failure(Transport t, int id, uint64_t size, const std::system_error& e) {
    ConnectionResult r;
    r.transport = t;
    r.id = id;
    r.bytes_requested = size;
    r.ok = false;
    r.error = std::string("thread: ") + e.what();
    return r;
}

} // namespace

SpeedTestClient::SpeedTestClient(const SpeedTestClientArgs& args)
    : A(args), listener(listener_args(args)) {}

bool SpeedTestClient::init() {
    if (A.tcp_count < 0 || A.udp_count < 0) {
        std::cerr << "Connection counts must be >= 0\n";
        return false;
    }
    if (!listener.init()) return false;
    std::cerr << "Client started, listening for offer requests on port " << listener.port() << "\n";
    return true;
}

std::optional<ServerOffer> SpeedTestClient::discover(int timeout_ms) {
    auto offer = listener.wait_for_offer(timeout_ms);
    if (offer) {
        std::cerr << "Received offer from " << offer->ip
                  << " (udp=" << offer->udp_port << ", tcp=" << offer->tcp_port << ")\n";
    }
    return offer;
}

SpeedTestReport SpeedTestClient::run_test(const ServerOffer& server) {
    ResultCollector collector;
    TaskGroup workers;

    for (int i = 1; i <= A.tcp_count; ++i) {
        TcpWorkerArgs w;
        w.server_ip = server.ip;
        w.port = server.tcp_port;
        w.file_size = A.file_size;
        w.id = i;
        w.connect_timeout_ms = A.connect_timeout_ms;
        w.io_timeout_ms = A.io_timeout_ms;
        try {
            workers.spawn([w, &collector] { collector.add(TcpWorker(w).run()); });
        } catch (const std::system_error& e) {
            collector.add(spawn_failure(Transport::TCP, i, A.file_size, e));
        }
    }

    for (int i = 1; i <= A.udp_count; ++i) {
        UdpWorkerArgs w;
        w.server_ip = server.ip;
        w.port = server.udp_port;
        w.file_size = A.file_size;
        w.id = i;
        w.idle_timeout_ms = A.udp_idle_timeout_ms;
        w.rcvbuf = A.udp_rcvbuf;
        try {
            workers.spawn([w, &collector] { collector.add(UdpWorker(w).run()); });
        } catch (const std::system_error& e) {
            collector.add(spawn_failure(Transport::UDP, i, A.file_size, e));
        }
    }

    // Barrier: the report only makes sense once every worker has reported.
    workers.join_all();

    // Offers queued during the run may come from a server that is gone now.
    size_t stale = listener.discard_pending();
    if (A.verbose && stale > 0) {
        std::cerr << "Discarded " << stale << " offers received during the test\n";
    }

    SpeedTestReport report = collector.take();
    if (A.verbose) {
        std::cerr << "All transfers complete: " << report.results.size() << " connections, "
                  << report.failures() << " failed\n";
    }
    return report;
}

std::optional<SpeedTestReport> SpeedTestClient::run(int discover_timeout_ms) {
    auto offer = discover(discover_timeout_ms);
    if (!offer) return std::nullopt;
    return run_test(*offer);
}
