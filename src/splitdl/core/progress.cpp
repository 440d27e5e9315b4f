// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/progress.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <iomanip>
#include <sstream>

namespace splitdl::core {

//=============================================================================
// TransferProgress
//=============================================================================

TransferProgress::clock::time_point TransferProgress::start_time() const noexcept {
    return clock::time_point(clock::duration(start_ns_.load(std::memory_order_acquire)));
}

std::chrono::milliseconds TransferProgress::elapsed() const noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start_time());
}

double TransferProgress::speed() const noexcept {
    auto ms = elapsed().count();
    if (ms <= 0) return 0.0;
    return static_cast<double>(bytes_transferred()) * 1000.0 / static_cast<double>(ms);
}

double TransferProgress::percent() const noexcept {
    auto total = total_size();
    if (total == 0) return 0.0;
    return static_cast<double>(bytes_transferred()) * 100.0 / static_cast<double>(total);
}

ProgressSnapshot TransferProgress::snapshot() const {
    ProgressSnapshot snap;
    snap.total_bytes = total_size();
    snap.transferred_bytes = bytes_transferred();
    snap.segments_completed = segments_completed();
    snap.elapsed = elapsed();
    auto ms = snap.elapsed.count();
    snap.speed_bps = ms > 0
        ? static_cast<double>(snap.transferred_bytes) * 1000.0 / static_cast<double>(ms)
        : 0.0;
    snap.percent = snap.total_bytes > 0
        ? static_cast<double>(snap.transferred_bytes) * 100.0 / static_cast<double>(snap.total_bytes)
        : 0.0;
    return snap;
}

//=============================================================================
// ProgressMonitor
//=============================================================================

ProgressMonitor::ProgressMonitor(std::shared_ptr<const TransferProgress> progress,
                                 std::string locator,
                                 std::string filename,
                                 std::chrono::milliseconds interval,
                                 ProgressCallback callback)
    : progress_(std::move(progress))
    , locator_(std::move(locator))
    , filename_(std::move(filename))
    , interval_(interval)
    , callback_(std::move(callback)) {}

ProgressMonitor::~ProgressMonitor() {
    stop();
}

void ProgressMonitor::start() {
    if (poller_.joinable() || !callback_ || !progress_) return;

    poller_ = std::jthread([this](std::stop_token stoken) {
        std::unique_lock lock(mutex_);
        while (!stoken.stop_requested()) {
            // Wakes early when stop() is requested
            cv_.wait_for(lock, stoken, interval_, [] { return false; });
            if (stoken.stop_requested()) break;
            lock.unlock();
            report();
            lock.lock();
        }
    });
}

void ProgressMonitor::stop() noexcept {
    if (!poller_.joinable()) return;

    poller_.request_stop();
    poller_.join();

    // Final consistent read after all writers are done
    report();
}

void ProgressMonitor::report() noexcept {
    try {
        ProgressSnapshot snap = progress_->snapshot();
        snap.locator = locator_;
        snap.filename = filename_;
        callback_(snap);
        reports_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        spdlog::warn("Progress reporter for {} threw: {}", locator_, e.what());
    }
}

//=============================================================================
// Formatting
//=============================================================================

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    std::ostringstream ss;
    ss << std::fixed;
    if (bytes >= TB) {
        ss << std::setprecision(2) << (static_cast<double>(bytes) / TB) << " TB";
    } else if (bytes >= GB) {
        ss << std::setprecision(2) << (static_cast<double>(bytes) / GB) << " GB";
    } else if (bytes >= MB) {
        ss << std::setprecision(1) << (static_cast<double>(bytes) / MB) << " MB";
    } else if (bytes >= KB) {
        ss << std::setprecision(0) << (static_cast<double>(bytes) / KB) << " KB";
    } else {
        ss << bytes << " B";
    }
    return ss.str();
}

std::string format_speed(double bytes_per_second) {
    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * KB;
    constexpr double GB = 1024.0 * MB;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);
    if (bytes_per_second >= GB) {
        ss << (bytes_per_second / GB) << " GB/s";
    } else if (bytes_per_second >= MB) {
        ss << (bytes_per_second / MB) << " MB/s";
    } else if (bytes_per_second >= KB) {
        ss << (bytes_per_second / KB) << " KB/s";
    } else {
        ss << bytes_per_second << " B/s";
    }
    return ss.str();
}

void to_json(nlohmann::json& j, const ProgressSnapshot& snap) {
    j = nlohmann::json{
        {"locator", snap.locator},
        {"filename", snap.filename},
        {"total_bytes", snap.total_bytes},
        {"transferred_bytes", snap.transferred_bytes},
        {"segments_completed", snap.segments_completed},
        {"elapsed_ms", snap.elapsed.count()},
        {"speed_bps", snap.speed_bps},
        {"percent", snap.percent},
    };
}

} // namespace splitdl::core
