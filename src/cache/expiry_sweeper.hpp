#pragma once

#include "cache/cache.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace blast::cache {

/**
 * ExpirySweeper - Background thread that purges expired cache entries
 * periodically
 */
class ExpirySweeper {
public:
    using SweepCallback = std::function<void(size_t purged)>;

    explicit ExpirySweeper(Cache& cache);
    ~ExpirySweeper();

    BLAST_DISALLOW_COPY(ExpirySweeper);

    // Start/stop the sweeper
    void start(std::chrono::milliseconds interval = std::chrono::minutes(10));
    void stop();
    bool is_running() const { return running_; }

    // Called from the worker thread after every sweep that removed entries.
    // May be replaced while running.
    void set_sweep_callback(SweepCallback callback);

    // Run a sweep now instead of waiting for the interval
    void trigger();

    struct Stats {
        uint64_t total_sweeps{0};
        uint64_t failed_sweeps{0};
        uint64_t last_sweep_timestamp{0};
        uint64_t entries_purged_total{0};
        uint64_t uptime_seconds{0};
    };

    Stats get_stats() const;

private:
    void run_loop(std::chrono::milliseconds interval);
    void perform_sweep();

    Cache& cache_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};

    std::mutex callback_mutex_;
    SweepCallback sweep_callback_;

    std::mutex wake_mutex_;
    std::condition_variable wake_;
    bool triggered_{false};

    mutable std::mutex stats_mutex_;
    Stats stats_;
    std::chrono::system_clock::time_point start_time_;
};

} // namespace blast::cache
