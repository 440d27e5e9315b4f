// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <splitdl/core/http_session.hpp>
#include <splitdl/core/progress.hpp>
#include <splitdl/disk/file_writer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace splitdl::core {

// Inclusive byte range [start, end] handled by one connection
struct SegmentRange {
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::uint32_t index{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }

    bool operator==(const SegmentRange&) const = default;
};

// Sorted by start, contiguous, covering [0, total)
using SegmentPlan = std::vector<SegmentRange>;

// Split total_size into connection_count ranges; the last one absorbs the remainder.
// When total_size < connection_count every range is one byte long. total_size == 0 yields no ranges.
[[nodiscard]] SegmentPlan plan_segments(std::uint64_t total_size, std::uint32_t connection_count);

// Segment state machine
enum class SegmentState : std::uint8_t {
    pending,     // Not started
    downloading, // Request in flight
    backoff,     // Waiting before the next attempt
    completed,   // Finished successfully
    failed,      // Retries exhausted or disk error
    cancelled    // Stop requested
};

struct RetryPolicy {
    std::uint32_t max_attempts{3};
    std::chrono::milliseconds backoff{1000};
};

// Downloads one byte range into the pre-sized output file.
// A retry resumes from the first byte this segment has not yet written.
class Segment {
public:
    Segment(SegmentRange range,
            std::string locator,
            HttpTransport& transport,
            disk::FileWriter& writer,
            std::shared_ptr<TransferProgress> progress,
            RetryPolicy policy) noexcept;

    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;

    // Runs every attempt on the calling thread; empty error_code on success
    [[nodiscard]] std::error_code run(std::stop_token stoken) noexcept;

    [[nodiscard]] const SegmentRange& range() const noexcept { return range_; }
    [[nodiscard]] std::uint32_t index() const noexcept { return range_.index; }
    [[nodiscard]] SegmentState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint64_t written() const noexcept { return written_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint32_t attempts() const noexcept { return attempts_.load(std::memory_order_relaxed); }

    // Cause of the last failed attempt
    [[nodiscard]] const std::error_code& last_error() const noexcept { return last_error_; }
    [[nodiscard]] std::int32_t last_status() const noexcept { return last_status_; }

private:
    [[nodiscard]] std::error_code attempt(std::stop_token stoken) noexcept;
    [[nodiscard]] bool wait_backoff(std::stop_token stoken) noexcept;

    void state(SegmentState s) noexcept { state_.store(s, std::memory_order_release); }

    SegmentRange range_;
    std::string locator_;
    HttpTransport& transport_;
    disk::FileWriter& writer_;
    std::shared_ptr<TransferProgress> progress_;
    RetryPolicy policy_;

    std::atomic<SegmentState> state_{SegmentState::pending};
    std::atomic<std::uint64_t> written_{0};
    std::atomic<std::uint32_t> attempts_{0};
    std::error_code last_error_;
    std::int32_t last_status_{0};
};

} // namespace splitdl::core
