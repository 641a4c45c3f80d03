#include "cache/expiry_sweeper.hpp"
#include "utils/logger.hpp"

namespace blast::cache {

ExpirySweeper::ExpirySweeper(Cache& cache)
    : cache_(cache)
{}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

void ExpirySweeper::start(std::chrono::milliseconds interval) {
    if (running_) {
        BLAST_LOG_WARN("ExpirySweeper already running");
        return;
    }

    running_ = true;
    start_time_ = std::chrono::system_clock::now();
    worker_thread_ = std::thread([this, interval]() { run_loop(interval); });
}

void ExpirySweeper::run_loop(std::chrono::milliseconds interval) {
    BLAST_LOG_INFO("ExpirySweeper started with {} ms interval", interval.count());

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_.wait_for(lock, interval, [this]() { return triggered_ || !running_; });
            if (!running_) {
                break;
            }
            if (triggered_) {
                BLAST_LOG_DEBUG("Manual expiry sweep triggered");
                triggered_ = false;
            }
        }

        perform_sweep();
    }

    BLAST_LOG_INFO("ExpirySweeper stopped");
}

void ExpirySweeper::stop() {
    if (!running_) {
        return;
    }

    BLAST_LOG_INFO("Stopping ExpirySweeper...");
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    wake_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void ExpirySweeper::set_sweep_callback(SweepCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    sweep_callback_ = std::move(callback);
}

void ExpirySweeper::trigger() {
    if (!running_) {
        BLAST_LOG_WARN("Cannot trigger sweep: ExpirySweeper not running");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        triggered_ = true;
    }
    wake_.notify_all();
}

void ExpirySweeper::perform_sweep() {
    auto now = std::chrono::system_clock::now();
    auto result = cache_.purge_expired();
    size_t purged = result.is_ok() ? result.value() : 0;

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_sweeps++;
        stats_.last_sweep_timestamp = static_cast<uint64_t>(std::chrono::system_clock::to_time_t(now));
        if (result.is_err()) {
            stats_.failed_sweeps++;
        }
        stats_.entries_purged_total += purged;
    }

    if (result.is_err()) {
        BLAST_LOG_ERROR("Error during expiry sweep: {}", result.error().to_string());
        return;
    }

    if (purged == 0) {
        return;
    }

    SweepCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = sweep_callback_;
    }
    if (callback) {
        callback(purged);
    }
}

ExpirySweeper::Stats ExpirySweeper::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);

    auto stats = stats_;

    if (running_) {
        auto now = std::chrono::system_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_);
        stats.uptime_seconds = static_cast<uint64_t>(uptime.count());
    }

    return stats;
}

} // namespace blast::cache
