// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/batch_scheduler.hpp>
#include <splitdl/core/download_engine.hpp>
#include <splitdl/core/logging.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace splitdl::core {

//=============================================================================
// AdmissionGate
//=============================================================================

void AdmissionGate::Ticket::release() noexcept {
    if (auto* gate = std::exchange(gate_, nullptr)) {
        gate->release_slot();
    }
}

AdmissionGate::AdmissionGate(std::uint32_t capacity) noexcept
    : capacity_(std::max<std::uint32_t>(capacity, 1)) {}

AdmissionGate::Ticket AdmissionGate::acquire(std::stop_token stoken) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool admitted = cv_.wait(lock, stoken, [this] {
        return active_.load(std::memory_order_relaxed) < capacity_;
    });
    if (!admitted) {
        return Ticket{};
    }

    const auto now = active_.fetch_add(1, std::memory_order_acq_rel) + 1;
    if (now > peak_.load(std::memory_order_relaxed)) {
        peak_.store(now, std::memory_order_release);
    }
    return Ticket{this};
}

void AdmissionGate::release_slot() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.fetch_sub(1, std::memory_order_acq_rel);
    }
    cv_.notify_one();
}

//=============================================================================
// BatchScheduler
//=============================================================================

BatchScheduler::BatchScheduler(EngineConfig config, HttpTransport& transport)
    : config_(std::move(config))
    , transport_(transport)
    , gate_(config_.max_concurrent_files) {
    init_logging(config_.log_level);
}

BatchResult BatchScheduler::run(const std::vector<TransferRequest>& requests, std::stop_token stoken) {
    BatchResult result;

    // Anything never launched keeps this outcome
    result.outcomes.resize(requests.size());
    for (std::size_t i = 0; i < requests.size(); ++i) {
        auto& outcome = result.outcomes[i];
        outcome.locator = requests[i].locator;
        outcome.status = TransferStatus::interrupted;
        outcome.error = make_error_code(DownloadErrc::cancelled);
        outcome.reason = "not started";
    }

    spdlog::info("Starting batch of {} downloads, {} at a time", requests.size(), gate_.capacity());

    {
        std::vector<std::jthread> workers;
        workers.reserve(requests.size());

        for (std::size_t i = 0; i < requests.size(); ++i) {
            if (stoken.stop_requested()) break;

            auto ticket = gate_.acquire(stoken);
            if (!ticket) break;

            workers.emplace_back([this, &requests, &result, i, stoken, t = std::move(ticket)]() mutable {
                result.outcomes[i] = run_one(requests[i], stoken);
                t.release();
            });
        }
    }  // Joins every launched engine

    result.succeeded = static_cast<std::size_t>(std::count_if(
        result.outcomes.begin(), result.outcomes.end(),
        [](const TransferOutcome& o) { return o.success(); }));

    spdlog::info("Batch download complete: {}/{} successful", result.succeeded, requests.size());
    return result;
}

TransferOutcome BatchScheduler::run_one(const TransferRequest& request, std::stop_token stoken) noexcept {
    try {
        TransferRequest effective = request;
        if (effective.destination.empty()) {
            effective.destination = config_.output_directory;
        }

        DownloadEngine engine(std::move(effective), config_, transport_);
        if (callback_) {
            engine.on_progress(callback_);
        }
        return engine.run(stoken);
    } catch (const std::exception& e) {
        spdlog::error("Download of {} failed: {}", request.locator, e.what());
        TransferOutcome outcome;
        outcome.locator = request.locator;
        outcome.status = TransferStatus::failed;
        outcome.error = make_error_code(DownloadErrc::network_error);
        outcome.reason = e.what();
        return outcome;
    }
}

} // namespace splitdl::core
