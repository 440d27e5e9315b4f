// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/config.hpp>
#include <splitdl/core/http_session.hpp>
#include <splitdl/core/progress.hpp>
#include <splitdl/core/request.hpp>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <utility>
#include <vector>

namespace splitdl::core {

// Counting gate bounding how many files transfer at once
class AdmissionGate {
public:
    // Holds one slot until destroyed or released
    class Ticket {
    public:
        Ticket() noexcept = default;
        ~Ticket() { release(); }

        Ticket(Ticket&& other) noexcept : gate_(std::exchange(other.gate_, nullptr)) {}
        Ticket& operator=(Ticket&& other) noexcept {
            if (this != &other) {
                release();
                gate_ = std::exchange(other.gate_, nullptr);
            }
            return *this;
        }

        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;

        void release() noexcept;
        [[nodiscard]] explicit operator bool() const noexcept { return gate_ != nullptr; }

    private:
        friend class AdmissionGate;
        explicit Ticket(AdmissionGate* gate) noexcept : gate_(gate) {}

        AdmissionGate* gate_{nullptr};
    };

    explicit AdmissionGate(std::uint32_t capacity) noexcept;

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // Blocks until a slot frees up; an empty ticket means stop was requested
    [[nodiscard]] Ticket acquire(std::stop_token stoken);

    [[nodiscard]] std::uint32_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::uint32_t active() const noexcept { return active_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint32_t peak() const noexcept { return peak_.load(std::memory_order_acquire); }

private:
    void release_slot() noexcept;

    const std::uint32_t capacity_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::atomic<std::uint32_t> active_{0};
    std::atomic<std::uint32_t> peak_{0};
};

struct BatchResult {
    std::vector<TransferOutcome> outcomes;  // Same order as the requests
    std::size_t succeeded{0};
};

// Runs a DownloadEngine per request, at most max_concurrent_files at a time.
// Every request ends with an outcome; one failure never stops the others.
// Construction applies config.log_level to the default logger. Pair with
// HttpSession(config) so network calls share config.timeout_seconds.
class BatchScheduler {
public:
    BatchScheduler(EngineConfig config, HttpTransport& transport);

    BatchScheduler(const BatchScheduler&) = delete;
    BatchScheduler& operator=(const BatchScheduler&) = delete;

    // Forwarded to every engine
    void on_progress(ProgressCallback cb) { callback_ = std::move(cb); }

    [[nodiscard]] BatchResult run(const std::vector<TransferRequest>& requests, std::stop_token stoken);

    [[nodiscard]] const AdmissionGate& gate() const noexcept { return gate_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] TransferOutcome run_one(const TransferRequest& request, std::stop_token stoken) noexcept;

    EngineConfig config_;
    HttpTransport& transport_;
    ProgressCallback callback_;
    AdmissionGate gate_;
};

} // namespace splitdl::core
