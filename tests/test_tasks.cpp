#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "speedtest_tasks.h"

using namespace std::chrono_literals;

TEST(TaskGroupTest, JoinAllWaitsForEveryTask) {
    std::atomic<int> done{0};
    TaskGroup g;
    for (int i = 0; i < 10; ++i) {
        g.spawn([&done] {
            std::this_thread::sleep_for(20ms);
            done++;
        });
    }
    g.join_all();
    EXPECT_EQ(done.load(), 10);
    EXPECT_EQ(g.running(), 0u);
}

TEST(TaskGroupTest, ReapLeavesRunningTasksAlone) {
    std::atomic<bool> release{false};
    TaskGroup g;
    g.spawn([] {});
    g.spawn([&release] {
        while (!release.load()) std::this_thread::sleep_for(1ms);
    });

    std::this_thread::sleep_for(50ms);
    g.reap_finished();
    EXPECT_EQ(g.running(), 1u);

    release = true;
    g.join_all();
    EXPECT_EQ(g.running(), 0u);
}

TEST(TaskGroupTest, TasksMaySpawnTasks) {
    std::atomic<int> done{0};
    TaskGroup g;
    g.spawn([&g, &done] {
        g.spawn([&done] { done++; });
        done++;
    });
    g.join_all();
    EXPECT_EQ(done.load(), 2);
}

TEST(TaskGroupTest, ConcurrentSpawnsAreAllTracked) {
    std::atomic<bool> release{false};
    std::atomic<int> done{0};
    TaskGroup g;

    std::vector<std::thread> spawners;
    for (int i = 0; i < 4; ++i) {
        spawners.emplace_back([&] {
            for (int j = 0; j < 5; ++j) {
                g.spawn([&] {
                    while (!release.load()) std::this_thread::sleep_for(1ms);
                    done++;
                });
            }
        });
    }
    for (auto& t : spawners) t.join();

    EXPECT_EQ(g.running(), 20u);
    release = true;
    g.join_all();
    EXPECT_EQ(done.load(), 20);
    EXPECT_EQ(g.running(), 0u);
}
