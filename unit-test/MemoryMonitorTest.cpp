#include <atomic>
#include <stdexcept>
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/memory_monitor.hpp"

using namespace std;
using namespace executor;
using namespace executor::sandbox;

TEST(MemoryMonitorTest, TracksPeak) {
    atomic<int> calls{0};
    const int64_t samples[] = {1 << 20, 5 << 20, 3 << 20};
    memory_monitor monitor([&]() -> optional<int64_t> {
        int i = calls++;
        return samples[min(i, 2)];
    }, chrono::milliseconds(1), chrono::seconds(10));

    while (calls < 5) this_thread::sleep_for(chrono::milliseconds(1));
    monitor.stop();
    EXPECT_EQ(monitor.peak_kb(chrono::seconds(1)), 5 * 1024);
}

TEST(MemoryMonitorTest, DefaultsWithoutSamples) {
    memory_monitor monitor([]() -> optional<int64_t> { return nullopt; },
                           chrono::milliseconds(1), chrono::seconds(10));
    this_thread::sleep_for(chrono::milliseconds(20));
    monitor.stop();
    EXPECT_EQ(monitor.peak_kb(chrono::seconds(1)), memory_monitor::DEFAULT_MEMORY_KB);
}

TEST(MemoryMonitorTest, FailedSamplesAreIgnored) {
    atomic<int> calls{0};
    memory_monitor monitor([&]() -> optional<int64_t> {
        if (calls++ % 2 == 0) throw runtime_error("cgroup removed");
        return 2048 * 1024;
    }, chrono::milliseconds(1), chrono::seconds(10));

    while (calls < 4) this_thread::sleep_for(chrono::milliseconds(1));
    monitor.stop();
    EXPECT_EQ(monitor.peak_kb(chrono::seconds(1)), 2048);
}

TEST(MemoryMonitorTest, StopsAfterLifetime) {
    atomic<int> calls{0};
    memory_monitor monitor([&]() -> optional<int64_t> {
        ++calls;
        return 4096;
    }, chrono::milliseconds(5), chrono::milliseconds(50));

    elapsed_time timer;
    // 没有调用 stop，采样线程在生存时间结束后自行退出
    EXPECT_EQ(monitor.peak_kb(chrono::seconds(5)), 4);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 1000);

    int observed = calls;
    this_thread::sleep_for(chrono::milliseconds(30));
    EXPECT_EQ(calls, observed);
}

TEST(MemoryMonitorTest, ResultIsStable) {
    memory_monitor monitor([]() -> optional<int64_t> { return 1 << 20; },
                           chrono::milliseconds(1), chrono::seconds(10));
    monitor.stop();
    int64_t first = monitor.peak_kb(chrono::seconds(1));
    EXPECT_EQ(first, 1024);
    EXPECT_EQ(monitor.peak_kb(chrono::seconds(1)), first);
}
