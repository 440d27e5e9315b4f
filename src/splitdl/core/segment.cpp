// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/segment.hpp>
#include <splitdl/core/config.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace splitdl::core {

//=============================================================================
// Planning
//=============================================================================

SegmentPlan plan_segments(std::uint64_t total_size, std::uint32_t connection_count) {
    SegmentPlan plan;
    if (total_size == 0) return plan;

    std::uint64_t count = std::max<std::uint32_t>(connection_count, 1);
    count = std::min(count, total_size);  // Every segment holds at least one byte

    const std::uint64_t base = total_size / count;
    plan.reserve(static_cast<std::size_t>(count));

    for (std::uint64_t i = 0; i < count; ++i) {
        SegmentRange seg;
        seg.index = static_cast<std::uint32_t>(i);
        seg.start = i * base;
        seg.end = (i == count - 1) ? total_size - 1 : (i + 1) * base - 1;
        plan.push_back(seg);
    }
    return plan;
}

//=============================================================================
// Segment
//=============================================================================

Segment::Segment(SegmentRange range,
                 std::string locator,
                 HttpTransport& transport,
                 disk::FileWriter& writer,
                 std::shared_ptr<TransferProgress> progress,
                 RetryPolicy policy) noexcept
    : range_(range)
    , locator_(std::move(locator))
    , transport_(transport)
    , writer_(writer)
    , progress_(std::move(progress))
    , policy_(policy) {}

std::error_code Segment::run(std::stop_token stoken) noexcept {
    const std::uint32_t max_attempts = std::max<std::uint32_t>(policy_.max_attempts, 1);

    for (std::uint32_t n = 1; n <= max_attempts; ++n) {
        if (stoken.stop_requested()) {
            state(SegmentState::cancelled);
            return make_error_code(DownloadErrc::cancelled);
        }

        attempts_.store(n, std::memory_order_relaxed);
        state(SegmentState::downloading);

        auto ec = attempt(stoken);
        if (!ec) {
            state(SegmentState::completed);
            progress_->segment_completed();
            spdlog::debug("Segment {} of {} complete ({} bytes)", range_.index, locator_, range_.length());
            return {};
        }

        last_error_ = ec;

        if (ec == DownloadErrc::cancelled || stoken.stop_requested()) {
            state(SegmentState::cancelled);
            return make_error_code(DownloadErrc::cancelled);
        }

        // Local disk failures will not get better by asking the server again
        if (ec.category() == disk::disk_errc_category()) {
            spdlog::error("Segment {}: cannot write output: {}", range_.index, ec.message());
            state(SegmentState::failed);
            return ec;
        }

        if (n < max_attempts) {
            spdlog::warn("Segment {} attempt {}/{} failed: {}", range_.index, n, max_attempts, ec.message());
            state(SegmentState::backoff);
            if (!wait_backoff(stoken)) {
                state(SegmentState::cancelled);
                return make_error_code(DownloadErrc::cancelled);
            }
        } else {
            spdlog::error("Segment {} failed after {} attempts: {}", range_.index, max_attempts, ec.message());
        }
    }

    state(SegmentState::failed);
    return make_error_code(DownloadErrc::retries_exhausted);
}

std::error_code Segment::attempt(std::stop_token stoken) noexcept {
    const std::uint64_t length = range_.length();
    const std::uint64_t already = written_.load(std::memory_order_relaxed);
    if (already >= length) {
        return {};
    }

    // Resume where the previous attempt stopped
    const ByteRange request{range_.start + already, range_.end};
    std::uint64_t body_seen = 0;
    std::error_code write_error;

    DataSink sink = [&](std::int32_t status, std::string_view chunk) -> bool {
        if (status == 200) {
            // Full-content reply to a range request: skip to our offset
            const std::uint64_t before = body_seen;
            body_seen += chunk.size();
            if (body_seen <= request.first) return true;
            if (before < request.first) {
                chunk.remove_prefix(static_cast<std::size_t>(request.first - before));
            }
        } else if (status != 206) {
            return true;
        }

        while (!chunk.empty()) {
            const std::uint64_t done = written_.load(std::memory_order_relaxed);
            const std::uint64_t room = length - done;
            if (room == 0) {
                return false;  // Server sent more than we asked for
            }

            const std::size_t n = static_cast<std::size_t>(
                std::min<std::uint64_t>({chunk.size(), SUB_CHUNK_SIZE, room}));
            if (auto ec = writer_.write_at(range_.start + done, chunk.data(), n)) {
                write_error = ec;
                return false;
            }
            written_.fetch_add(n, std::memory_order_relaxed);
            progress_->add_bytes(n);
            chunk.remove_prefix(n);
        }
        return true;
    };

    auto result = transport_.get(locator_, request, sink, stoken);

    if (write_error) {
        return write_error;
    }

    const bool filled = written_.load(std::memory_order_relaxed) >= length;

    if (!result) {
        // Aborted on purpose after the range was complete
        if (filled && result.error() == DownloadErrc::write_aborted) {
            return {};
        }
        return result.error();
    }

    last_status_ = result->status_code;
    if (result->status_code != 206 && result->status_code != 200) {
        spdlog::warn("Segment {}: HTTP {}", range_.index, result->status_code);
        return status_to_error(result->status_code);
    }

    if (!filled) {
        return make_error_code(DownloadErrc::incomplete_body);
    }
    return {};
}

bool Segment::wait_backoff(std::stop_token stoken) noexcept {
    if (policy_.backoff.count() <= 0) {
        return !stoken.stop_requested();
    }

    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stoken, policy_.backoff, [] { return false; });
    return !stoken.stop_requested();
}

} // namespace splitdl::core
