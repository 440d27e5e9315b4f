// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/stream_transfer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace splitdl::core {

StreamTransfer::StreamTransfer(std::string locator,
                               HttpTransport& transport,
                               disk::FileWriter& writer,
                               std::shared_ptr<TransferProgress> progress,
                               std::size_t chunk_size) noexcept
    : locator_(std::move(locator))
    , transport_(transport)
    , writer_(writer)
    , progress_(std::move(progress))
    , chunk_size_(std::max<std::size_t>(chunk_size, 1)) {}

std::error_code StreamTransfer::run(std::stop_token stoken) noexcept {
    try {
        disk::ChunkBuffer buffer(chunk_size_);
        std::error_code write_error;

        auto flush_chunk = [&]() -> bool {
            if (buffer.empty()) return true;
            if (auto ec = writer_.append(buffer.data(), buffer.size())) {
                write_error = ec;
                return false;
            }
            written_ += buffer.size();
            progress_->add_bytes(buffer.size());
            buffer.reset();
            return true;
        };

        DataSink sink = [&](std::int32_t status, std::string_view chunk) -> bool {
            if (status != 200) {
                return true;  // Dropped; the status check below fails the transfer
            }
            while (!chunk.empty()) {
                chunk.remove_prefix(buffer.fill(chunk.data(), chunk.size()));
                if (buffer.full() && !flush_chunk()) {
                    return false;
                }
            }
            return true;
        };

        auto result = transport_.get(locator_, std::nullopt, sink, stoken);

        if (write_error) {
            spdlog::error("Cannot write {}: {}", writer_.path(), write_error.message());
            return write_error;
        }

        if (!result) {
            if (stoken.stop_requested()) {
                return make_error_code(DownloadErrc::cancelled);
            }
            spdlog::error("Single stream download failed for {}: {}", locator_, result.error().message());
            return result.error();
        }

        status_ = result->status_code;
        if (status_ != 200) {
            spdlog::error("HTTP {} for {}", status_, locator_);
            return status_to_error(status_);
        }

        if (!flush_chunk()) {
            spdlog::error("Cannot write {}: {}", writer_.path(), write_error.message());
            return write_error;
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Single stream download failed for {}: {}", locator_, e.what());
        return make_error_code(DownloadErrc::stream_failed);
    }
}

} // namespace splitdl::core
