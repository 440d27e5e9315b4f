// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/config.hpp>
#include <splitdl/core/error.hpp>
#include <splitdl/core/http_session.hpp>
#include <splitdl/core/metadata_prober.hpp>
#include <splitdl/core/progress.hpp>
#include <splitdl/core/request.hpp>
#include <splitdl/core/segment.hpp>
#include <splitdl/disk/file_writer.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace splitdl::core {

// Per-locator state machine
enum class DownloadState : std::uint8_t {
    idle,         // Not started
    probing,      // Metadata request in flight
    allocating,   // Resolving the path, creating directories, pre-sizing
    transferring, // Segments or stream running
    succeeded,    // Output complete
    failed,       // Terminal error, partial output removed
    interrupted   // Stopped from outside, partial output removed
};

[[nodiscard]] const char* to_string(DownloadState state) noexcept;

// Which transfer strategy the engine chose
enum class TransferPath : std::uint8_t {
    none,
    segmented,
    stream
};

// Drives one TransferRequest from probe to outcome.
// One instance per request; run() may be called once.
class DownloadEngine {
public:
    DownloadEngine(TransferRequest request, EngineConfig config, HttpTransport& transport);
    ~DownloadEngine() = default;

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;
    DownloadEngine(DownloadEngine&&) noexcept = delete;
    DownloadEngine& operator=(DownloadEngine&&) noexcept = delete;

    // Set before run(); polled on a separate thread every progress_interval_ms
    void on_progress(ProgressCallback cb) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

    // Never throws; cancellation yields an interrupted outcome
    [[nodiscard]] TransferOutcome run(std::stop_token stoken) noexcept;

    [[nodiscard]] DownloadState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] TransferPath path() const noexcept { return path_.load(std::memory_order_acquire); }

    // Read-only handle for external reporters
    [[nodiscard]] std::shared_ptr<const TransferProgress> progress() const noexcept { return progress_; }

    // Valid once probing has finished
    [[nodiscard]] const ResourceMetadata& metadata() const noexcept { return metadata_; }
    [[nodiscard]] const std::string& output_path() const noexcept { return output_path_; }
    [[nodiscard]] const TransferRequest& request() const noexcept { return request_; }

private:
    struct Failure {
        std::error_code error;
        std::string reason;
    };

    [[nodiscard]] TransferOutcome execute(std::stop_token stoken);
    [[nodiscard]] Failure allocate_path();
    [[nodiscard]] Failure run_segmented(std::stop_token stoken);
    [[nodiscard]] Failure run_stream(std::stop_token stoken);

    [[nodiscard]] TransferOutcome finish(Failure failure);
    void state(DownloadState s) noexcept { state_.store(s, std::memory_order_release); }

    TransferRequest request_;
    EngineConfig config_;
    HttpTransport& transport_;

    std::shared_ptr<TransferProgress> progress_;
    ResourceMetadata metadata_;
    std::string output_path_;
    disk::FileWriter writer_;

    std::mutex callback_mutex_;
    ProgressCallback callback_;

    std::atomic<DownloadState> state_{DownloadState::idle};
    std::atomic<TransferPath> path_{TransferPath::none};
    std::atomic<bool> started_{false};
};

} // namespace splitdl::core
