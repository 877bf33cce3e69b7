#include "sandbox/memory_monitor.hpp"
#include <glog/logging.h>
#include <exception>

namespace executor::sandbox {
using namespace std;

memory_monitor::memory_monitor(sampler sample, chrono::milliseconds interval, chrono::milliseconds lifetime)
    : sample(move(sample)), future(result.get_future().share()) {
    worker = thread([this, interval, lifetime] { loop(interval, lifetime); });
}

memory_monitor::~memory_monitor() {
    stop();
    if (worker.joinable()) worker.join();
}

void memory_monitor::stop() {
    {
        scoped_lock guard(mut);
        stopped = true;
    }
    cv.notify_all();
}

int64_t memory_monitor::current_peak_kb() const {
    int64_t bytes = peak.load();
    if (bytes < 0) return DEFAULT_MEMORY_KB;
    return max<int64_t>(1, (bytes + 1023) / 1024);
}

int64_t memory_monitor::peak_kb(chrono::milliseconds timeout) {
    if (future.wait_for(timeout) == future_status::ready)
        return future.get();
    LOG(WARNING) << "Memory monitor did not finish in " << timeout.count() << "ms";
    return current_peak_kb();
}

void memory_monitor::loop(chrono::milliseconds interval, chrono::milliseconds lifetime) {
    auto deadline = chrono::steady_clock::now() + lifetime;
    while (true) {
        try {
            auto usage = sample();
            if (usage && *usage > 0) {
                int64_t current = peak.load();
                while (*usage > current && !peak.compare_exchange_weak(current, *usage))
                    ;
            }
        } catch (exception &e) {
            // 单次采样失败不影响后续采样
            DLOG(WARNING) << "Failed to sample memory usage: " << e.what();
        }

        unique_lock lock(mut);
        auto next = min(chrono::steady_clock::now() + interval, deadline);
        if (cv.wait_until(lock, next, [this] { return stopped; })) break;
        if (chrono::steady_clock::now() >= deadline) break;
    }
    result.set_value(current_peak_kb());
}

}  // namespace executor::sandbox
