#include "SpeedTestReport.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

const char* transport_name(Transport t) {
    return t == Transport::TCP ? "TCP" : "UDP";
}

double ConnectionResult::seconds() const {
    // Clamp to 1 us so an instant transfer never divides by zero
    auto us = std::max<long long>(elapsed.count(), 1);
    return us / 1e6;
}

double ConnectionResult::throughput_bps() const {
    return (static_cast<double>(bytes_transferred) * 8.0) / seconds();
}

double ConnectionResult::success_rate() const {
    if (!segments_expected || !segments_received || *segments_expected == 0) return 0.0;
    return static_cast<double>(*segments_received) / static_cast<double>(*segments_expected);
}

size_t SpeedTestReport::count(Transport t) const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [t](const ConnectionResult& r) { return r.transport == t; }));
}

size_t SpeedTestReport::failures() const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [](const ConnectionResult& r) { return !r.ok; }));
}

uint64_t SpeedTestReport::total_bytes(Transport t) const {
    uint64_t sum = 0;
    for (const auto& r : results) {
        if (r.transport == t) sum += r.bytes_transferred;
    }
    return sum;
}

void ResultCollector::add(ConnectionResult r) {
    std::lock_guard<std::mutex> lock(mu_);
    results_.push_back(std::move(r));
}

size_t ResultCollector::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return results_.size();
}

SpeedTestReport ResultCollector::take() {
    SpeedTestReport rep;
    {
        std::lock_guard<std::mutex> lock(mu_);
        rep.results.swap(results_);
    }
    std::stable_sort(rep.results.begin(), rep.results.end(),
        [](const ConnectionResult& a, const ConnectionResult& b) {
            if (a.transport != b.transport) return a.transport == Transport::TCP;
            return a.id < b.id;
        });
    return rep;
}

std::string format_result(const ConnectionResult& r) {
    std::ostringstream oss;
    oss << std::fixed;
    oss << transport_name(r.transport) << " transfer #" << r.id;
    if (!r.ok) oss << " failed (" << r.error << ")";
    else oss << " finished";
    oss << ", total time: " << std::setprecision(3) << r.seconds() << " seconds"
        << ", total speed: " << std::setprecision(2) << r.throughput_bps() << " bits/second";
    if (r.transport == Transport::UDP) {
        oss << ", percentage of packets received successfully: "
            << std::setprecision(2) << (r.success_rate() * 100.0) << "%";
    }
    return oss.str();
}
