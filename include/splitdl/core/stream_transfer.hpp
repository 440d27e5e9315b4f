// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <splitdl/core/http_session.hpp>
#include <splitdl/core/progress.hpp>
#include <splitdl/disk/file_writer.hpp>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>

namespace splitdl::core {

// Single sequential GET for servers without range support or small files.
// No retry: any transport error or non-200 status is terminal.
class StreamTransfer {
public:
    StreamTransfer(std::string locator,
                   HttpTransport& transport,
                   disk::FileWriter& writer,
                   std::shared_ptr<TransferProgress> progress,
                   std::size_t chunk_size) noexcept;

    [[nodiscard]] std::error_code run(std::stop_token stoken) noexcept;

    [[nodiscard]] std::uint64_t written() const noexcept { return written_; }
    [[nodiscard]] std::int32_t status() const noexcept { return status_; }

private:
    std::string locator_;
    HttpTransport& transport_;
    disk::FileWriter& writer_;
    std::shared_ptr<TransferProgress> progress_;
    std::size_t chunk_size_;
    std::uint64_t written_{0};
    std::int32_t status_{0};
};

} // namespace splitdl::core
