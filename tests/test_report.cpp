#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

#include "SpeedTestReport.h"
#include "UdpWorker.h"
#include "speedtest_size.h"

using namespace std::chrono_literals;

namespace {

ConnectionResult make_result(Transport t, int id, uint64_t bytes) {
    ConnectionResult r;
    r.transport = t;
    r.id = id;
    r.bytes_requested = bytes;
    r.bytes_transferred = bytes;
    r.elapsed = 1s;
    return r;
}

PayloadSegment segment(uint64_t total, uint64_t index, size_t len) {
    PayloadSegment s;
    s.total_segments = total;
    s.current_segment = index;
    s.data.assign(len, 'Y');
    return s;
}

} // namespace

TEST(ReportTest, ThroughputIsBitsPerSecond) {
    ConnectionResult r = make_result(Transport::TCP, 1, 1000000);
    r.elapsed = 500ms;
    EXPECT_DOUBLE_EQ(r.seconds(), 0.5);
    EXPECT_DOUBLE_EQ(r.throughput_bps(), 16000000.0);
}

TEST(ReportTest, ZeroElapsedDoesNotDivideByZero) {
    ConnectionResult r = make_result(Transport::TCP, 1, 10);
    r.elapsed = 0us;
    EXPECT_GT(r.throughput_bps(), 0.0);
}

TEST(ReportTest, SuccessRate) {
    ConnectionResult r = make_result(Transport::UDP, 1, 0);
    r.segments_received = 3;
    r.segments_expected = 4;
    EXPECT_DOUBLE_EQ(r.success_rate(), 0.75);

    r.segments_expected = 0;
    EXPECT_DOUBLE_EQ(r.success_rate(), 0.0);

    ConnectionResult tcp = make_result(Transport::TCP, 1, 10);
    EXPECT_DOUBLE_EQ(tcp.success_rate(), 0.0);
}

TEST(ReportTest, CollectorOrdersTcpThenUdpById) {
    ResultCollector c;
    c.add(make_result(Transport::UDP, 2, 5));
    c.add(make_result(Transport::TCP, 2, 5));
    c.add(make_result(Transport::UDP, 1, 5));
    c.add(make_result(Transport::TCP, 1, 5));

    SpeedTestReport rep = c.take();
    ASSERT_EQ(rep.results.size(), 4u);
    EXPECT_EQ(rep.results[0].transport, Transport::TCP);
    EXPECT_EQ(rep.results[0].id, 1);
    EXPECT_EQ(rep.results[1].transport, Transport::TCP);
    EXPECT_EQ(rep.results[1].id, 2);
    EXPECT_EQ(rep.results[2].transport, Transport::UDP);
    EXPECT_EQ(rep.results[2].id, 1);
    EXPECT_EQ(rep.results[3].id, 2);

    EXPECT_EQ(rep.count(Transport::TCP), 2u);
    EXPECT_EQ(rep.total_bytes(Transport::UDP), 10u);
    EXPECT_EQ(c.size(), 0u);
}

TEST(ReportTest, CollectorAcceptsConcurrentWriters) {
    ResultCollector c;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&c, t] {
            for (int i = 0; i < 100; ++i) {
                c.add(make_result(t % 2 ? Transport::UDP : Transport::TCP, t * 100 + i, 1));
            }
        });
    }
    for (auto& t : threads) t.join();

    SpeedTestReport rep = c.take();
    EXPECT_EQ(rep.results.size(), 800u);
    EXPECT_EQ(rep.count(Transport::TCP), 400u);
    EXPECT_EQ(rep.failures(), 0u);
}

TEST(ReportTest, FormatResultLines) {
    ConnectionResult tcp = make_result(Transport::TCP, 1, 1000);
    EXPECT_EQ(format_result(tcp),
              "TCP transfer #1 finished, total time: 1.000 seconds, total speed: 8000.00 bits/second");

    ConnectionResult udp = make_result(Transport::UDP, 2, 1000);
    udp.segments_received = 1;
    udp.segments_expected = 2;
    EXPECT_EQ(format_result(udp),
              "UDP transfer #2 finished, total time: 1.000 seconds, total speed: 8000.00 bits/second, "
              "percentage of packets received successfully: 50.00%");

    ConnectionResult bad = make_result(Transport::TCP, 3, 0);
    bad.ok = false;
    bad.error = "connect: Connection refused";
    EXPECT_NE(format_result(bad).find("failed (connect: Connection refused)"), std::string::npos);
}

TEST(SegmentTrackerTest, AllSegmentsOutOfOrderWithDuplicates) {
    SegmentTracker t;
    const uint64_t order[] = {3, 1, 3, 2, 1, 4};
    for (uint64_t i : order) t.accept(segment(4, i, i == 4 ? 10 : 100));

    EXPECT_TRUE(t.complete());
    EXPECT_EQ(t.received(), 4u);
    EXPECT_EQ(t.expected(), 4u);
    EXPECT_EQ(t.bytes(), 310u);
    EXPECT_EQ(t.duplicates(), 2u);
}

TEST(SegmentTrackerTest, PartialDelivery) {
    SegmentTracker t;
    EXPECT_TRUE(t.accept(segment(10, 2, 8)));
    EXPECT_TRUE(t.accept(segment(10, 9, 8)));
    EXPECT_TRUE(t.accept(segment(10, 5, 8)));

    EXPECT_FALSE(t.complete());
    EXPECT_EQ(t.received(), 3u);
    EXPECT_EQ(t.expected(), 10u);
}

TEST(SegmentTrackerTest, RejectsOutOfRangeAndConflictingTotals) {
    SegmentTracker t;
    EXPECT_FALSE(t.accept(segment(0, 1, 1)));
    EXPECT_EQ(t.expected(), 0u);

    EXPECT_TRUE(t.accept(segment(3, 1, 1)));
    EXPECT_FALSE(t.accept(segment(3, 0, 1)));
    EXPECT_FALSE(t.accept(segment(3, 4, 1)));
    EXPECT_FALSE(t.accept(segment(5, 2, 1)));
    EXPECT_EQ(t.received(), 1u);
    EXPECT_EQ(t.expected(), 3u);
}

TEST(SizeTest, ParsesUnits) {
    EXPECT_EQ(parse_size("500"), std::optional<uint64_t>(500));
    EXPECT_EQ(parse_size("500B"), std::optional<uint64_t>(500));
    EXPECT_EQ(parse_size("300K"), std::optional<uint64_t>(300 * 1024));
    EXPECT_EQ(parse_size("10mb"), std::optional<uint64_t>(10ULL * 1024 * 1024));
    EXPECT_EQ(parse_size("1.5GiB"), std::optional<uint64_t>(1536ULL * 1024 * 1024));
    EXPECT_EQ(parse_size("2TB"), std::optional<uint64_t>(2ULL * 1024 * 1024 * 1024 * 1024));

    EXPECT_FALSE(parse_size("").has_value());
    EXPECT_FALSE(parse_size("MB").has_value());
    EXPECT_FALSE(parse_size("10XB").has_value());
    EXPECT_FALSE(parse_size("-5").has_value());
    EXPECT_FALSE(parse_size("1.2.3").has_value());
    EXPECT_FALSE(parse_size("1..5MB").has_value());
}
