// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/download_engine.hpp>
#include <splitdl/core/stream_transfer.hpp>
#include <splitdl/core/url.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <optional>
#include <thread>

namespace splitdl::core {

const char* to_string(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::idle:         return "idle";
        case DownloadState::probing:      return "probing";
        case DownloadState::allocating:   return "allocating";
        case DownloadState::transferring: return "transferring";
        case DownloadState::succeeded:    return "succeeded";
        case DownloadState::failed:       return "failed";
        case DownloadState::interrupted:  return "interrupted";
    }
    return "unknown";
}

//=============================================================================
// DownloadEngine
//=============================================================================

DownloadEngine::DownloadEngine(TransferRequest request, EngineConfig config, HttpTransport& transport)
    : request_(std::move(request))
    , config_(std::move(config))
    , transport_(transport)
    , progress_(std::make_shared<TransferProgress>()) {}

TransferOutcome DownloadEngine::run(std::stop_token stoken) noexcept {
    if (started_.exchange(true, std::memory_order_acq_rel)) {
        TransferOutcome outcome;
        outcome.locator = request_.locator;
        outcome.error = make_error_code(DownloadErrc::invalid_config);
        outcome.reason = "engine already started";
        return outcome;
    }

    try {
        return execute(stoken);
    } catch (const std::exception& e) {
        spdlog::error("Download of {} failed: {}", request_.locator, e.what());
        writer_.close();
        if (!writer_.path().empty()) {
            (void)disk::remove_partial(writer_.path());
        }
        state(DownloadState::failed);

        TransferOutcome outcome;
        outcome.locator = request_.locator;
        outcome.file_path = output_path_;
        outcome.error = make_error_code(DownloadErrc::network_error);
        outcome.reason = e.what();
        return outcome;
    }
}

TransferOutcome DownloadEngine::execute(std::stop_token stoken) {
    auto url = Url::parse(request_.locator);
    if (!url || !url->is_http()) {
        spdlog::error("Invalid URL: {}", request_.locator);
        return finish({make_error_code(DownloadErrc::invalid_url), "invalid URL"});
    }

    if (stoken.stop_requested()) {
        return finish({make_error_code(DownloadErrc::cancelled), "interrupted"});
    }

    // Probing never fails; errors degrade to the stream path
    state(DownloadState::probing);
    spdlog::info("Analyzing {}", request_.locator);
    MetadataProber prober(transport_);
    metadata_ = prober.probe(request_.locator);
    spdlog::info("File size: {}, range support: {}",
                 metadata_.total_size > 0 ? format_bytes(metadata_.total_size) : std::string("unknown"),
                 metadata_.supports_ranges ? "yes" : "no");

    if (stoken.stop_requested()) {
        return finish({make_error_code(DownloadErrc::cancelled), "interrupted"});
    }

    state(DownloadState::allocating);
    if (auto failure = allocate_path(); failure.error) {
        return finish(std::move(failure));
    }

    const bool segmented = metadata_.supports_ranges
        && metadata_.total_size > config_.segment_threshold_bytes();

    std::optional<ProgressMonitor> monitor;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (callback_) {
            monitor.emplace(progress_, request_.locator,
                            std::filesystem::path(output_path_).filename().string(),
                            config_.progress_interval(), callback_);
        }
    }

    state(DownloadState::transferring);
    progress_->begin(metadata_.total_size);
    if (monitor) monitor->start();

    Failure failure = segmented ? run_segmented(stoken) : run_stream(stoken);

    // One final consistent read before the outcome is built
    if (monitor) monitor->stop();

    return finish(std::move(failure));
}

DownloadEngine::Failure DownloadEngine::allocate_path() {
    std::string filename = request_.filename.value_or(std::string{});
    if (filename.empty()) {
        filename = metadata_.filename;
    }

    std::filesystem::path dir(request_.destination.empty() ? std::string(".") : request_.destination);

    // An explicit filename may carry its own subdirectories
    const std::filesystem::path target = dir / filename;
    const std::filesystem::path parent = target.parent_path();

    std::error_code ec;
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    if (ec) {
        spdlog::error("Cannot create directory {}: {}", parent.string(), ec.message());
        return {make_error_code(disk::DiskErrc::directory_failed),
                "cannot create directory " + parent.string()};
    }

    output_path_ = target.string();
    spdlog::debug("Output path for {}: {}", request_.locator, output_path_);
    return {};
}

DownloadEngine::Failure DownloadEngine::run_segmented(std::stop_token stoken) {
    path_.store(TransferPath::segmented, std::memory_order_release);

    // Pre-size before any segment writes at its offset
    if (auto ec = writer_.open_presized(output_path_, metadata_.total_size)) {
        spdlog::error("Cannot allocate {} ({}): {}", output_path_,
                      format_bytes(metadata_.total_size), ec.message());
        return {ec, "cannot allocate " + output_path_};
    }
    spdlog::debug("Allocated {} bytes for {}", metadata_.total_size, output_path_);

    const SegmentPlan plan = plan_segments(metadata_.total_size, config_.connections_per_file);
    spdlog::info("Downloading with {} connections", plan.size());

    const RetryPolicy policy{config_.max_retries, config_.retry_backoff()};
    std::vector<std::unique_ptr<Segment>> segments;
    segments.reserve(plan.size());
    for (const auto& range : plan) {
        segments.push_back(std::make_unique<Segment>(
            range, request_.locator, transport_, writer_, progress_, policy));
    }

    // File-local stop: set by the caller's token or by the first failing segment
    std::stop_source file_stop;
    std::stop_callback forward(stoken, [&file_stop] { file_stop.request_stop(); });

    std::vector<std::error_code> results(segments.size());
    {
        std::vector<std::jthread> workers;
        workers.reserve(segments.size());
        for (std::size_t i = 0; i < segments.size(); ++i) {
            workers.emplace_back([&, i] {
                auto ec = segments[i]->run(file_stop.get_token());
                results[i] = ec;
                if (ec && ec != DownloadErrc::cancelled) {
                    file_stop.request_stop();
                }
            });
        }
    }  // Joins every segment

    // A real failure outranks the cancellations it triggered
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& ec = results[i];
        if (!ec || ec == DownloadErrc::cancelled) continue;

        const auto& seg = *segments[i];
        std::string reason;
        if (seg.last_status() != 0 && (seg.last_status() < 200 || seg.last_status() >= 300)) {
            reason = "HTTP " + std::to_string(seg.last_status()) + " on segment " + std::to_string(seg.index());
        } else {
            reason = "segment " + std::to_string(seg.index()) + ": " + seg.last_error().message();
        }
        spdlog::error("Segment {} failed after {} attempts", seg.index(), seg.attempts());
        return {make_error_code(DownloadErrc::segment_failed), std::move(reason)};
    }

    const bool any_cancelled = std::any_of(results.begin(), results.end(), [](const std::error_code& ec) {
        return ec == DownloadErrc::cancelled;
    });
    if (any_cancelled || stoken.stop_requested()) {
        return {make_error_code(DownloadErrc::cancelled), "interrupted"};
    }

    if (auto ec = writer_.flush()) {
        return {ec, "cannot flush " + output_path_};
    }
    return {};
}

DownloadEngine::Failure DownloadEngine::run_stream(std::stop_token stoken) {
    path_.store(TransferPath::stream, std::memory_order_release);
    spdlog::info("Downloading with single stream");

    if (auto ec = writer_.open_stream(output_path_)) {
        spdlog::error("Cannot open {}: {}", output_path_, ec.message());
        return {ec, "cannot open " + output_path_};
    }

    StreamTransfer transfer(request_.locator, transport_, writer_, progress_, config_.stream_chunk_size());
    auto ec = transfer.run(stoken);

    if (ec == DownloadErrc::cancelled || (ec && stoken.stop_requested())) {
        return {make_error_code(DownloadErrc::cancelled), "interrupted"};
    }
    if (ec) {
        if (transfer.status() != 0 && transfer.status() != 200) {
            return {ec, "HTTP " + std::to_string(transfer.status())};
        }
        return {ec, "stream transfer: " + ec.message()};
    }

    if (auto flush_ec = writer_.flush()) {
        return {flush_ec, "cannot flush " + output_path_};
    }
    spdlog::debug("Streamed {} bytes into {}", transfer.written(), output_path_);
    return {};
}

TransferOutcome DownloadEngine::finish(Failure failure) {
    writer_.close();

    TransferOutcome outcome;
    outcome.locator = request_.locator;
    outcome.file_path = output_path_;
    outcome.bytes_written = progress_->bytes_transferred();
    outcome.elapsed = progress_->elapsed();
    outcome.error = failure.error;
    outcome.reason = std::move(failure.reason);

    if (!failure.error) {
        outcome.status = TransferStatus::succeeded;
        state(DownloadState::succeeded);

        const double seconds = static_cast<double>(outcome.elapsed.count()) / 1000.0;
        spdlog::info("Downloaded {} ({}) in {:.2f}s, average {}",
                     output_path_, format_bytes(outcome.bytes_written), seconds,
                     format_speed(outcome.average_speed()));
        return outcome;
    }

    // Never leave a truncated file that looks complete
    if (!writer_.path().empty()) {
        (void)disk::remove_partial(writer_.path());
    }

    if (failure.error == DownloadErrc::cancelled) {
        outcome.status = TransferStatus::interrupted;
        state(DownloadState::interrupted);
        spdlog::warn("Download of {} interrupted", request_.locator);
    } else {
        outcome.status = TransferStatus::failed;
        state(DownloadState::failed);
        spdlog::error("Download of {} failed: {}", request_.locator, outcome.reason);
    }
    return outcome;
}

} // namespace splitdl::core
