// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace splitdl::core {

// Point-in-time copy of a transfer's counters
struct ProgressSnapshot {
    std::string locator;
    std::string filename;
    std::uint64_t total_bytes{0};
    std::uint64_t transferred_bytes{0};
    std::uint32_t segments_completed{0};
    std::chrono::milliseconds elapsed{0};
    double speed_bps{0.0};
    double percent{0.0};  // 0 when the total is unknown
};

// Per-locator counters. Written by segment/stream transfers (increment-only), read by reporters.
class TransferProgress {
public:
    using clock = std::chrono::steady_clock;

    TransferProgress() noexcept
        : start_ns_(clock::now().time_since_epoch().count()) {}

    // Set before transfers start; restarts the clock
    void begin(std::uint64_t total_size) noexcept {
        total_size_.store(total_size, std::memory_order_relaxed);
        start_ns_.store(clock::now().time_since_epoch().count(), std::memory_order_release);
    }

    void add_bytes(std::uint64_t n) noexcept { transferred_.fetch_add(n, std::memory_order_relaxed); }
    void segment_completed() noexcept { segments_completed_.fetch_add(1, std::memory_order_relaxed); }

    [[nodiscard]] std::uint64_t total_size() const noexcept { return total_size_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t bytes_transferred() const noexcept { return transferred_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint32_t segments_completed() const noexcept { return segments_completed_.load(std::memory_order_relaxed); }

    [[nodiscard]] clock::time_point start_time() const noexcept;
    [[nodiscard]] std::chrono::milliseconds elapsed() const noexcept;

    // Bytes per second since begin()
    [[nodiscard]] double speed() const noexcept;
    [[nodiscard]] double percent() const noexcept;

    [[nodiscard]] ProgressSnapshot snapshot() const;

private:
    std::atomic<clock::rep> start_ns_;
    std::atomic<std::uint64_t> total_size_{0};
    std::atomic<std::uint64_t> transferred_{0};
    std::atomic<std::uint32_t> segments_completed_{0};
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

// Polls one TransferProgress on a dedicated thread until stop() is called.
// stop() joins the poller and delivers exactly one final snapshot.
class ProgressMonitor {
public:
    ProgressMonitor(std::shared_ptr<const TransferProgress> progress,
                    std::string locator,
                    std::string filename,
                    std::chrono::milliseconds interval,
                    ProgressCallback callback);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void start();
    void stop() noexcept;

    [[nodiscard]] bool running() const noexcept { return poller_.joinable(); }
    [[nodiscard]] std::uint64_t reports() const noexcept { return reports_.load(std::memory_order_relaxed); }

private:
    void report() noexcept;

    std::shared_ptr<const TransferProgress> progress_;
    std::string locator_;
    std::string filename_;
    std::chrono::milliseconds interval_;
    ProgressCallback callback_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::atomic<std::uint64_t> reports_{0};
    std::jthread poller_;
};

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_speed(double bytes_per_second);

void to_json(nlohmann::json& j, const ProgressSnapshot& snap);

} // namespace splitdl::core
