// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/disk/error.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace splitdl::disk {

// Output file shared by all transfers of one resource.
// write_at() uses positioned writes, so segments writing disjoint ranges never share a cursor.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Create/truncate and allocate exactly `size` bytes before any segment write
    [[nodiscard]] std::error_code open_presized(std::string_view path, std::uint64_t size) noexcept;

    // Create/truncate for sequential writes, no pre-sizing
    [[nodiscard]] std::error_code open_stream(std::string_view path) noexcept;

    // Write at an absolute offset (thread-safe for disjoint ranges)
    [[nodiscard]] std::error_code write_at(std::uint64_t offset,
                                           const void* data,
                                           std::size_t size) noexcept;

    // Sequential write at the current end
    [[nodiscard]] std::error_code append(const void* data, std::size_t size) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_.load(std::memory_order_acquire) >= 0; }
    // Last path this writer opened successfully; empty when no open succeeded
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t allocated_size() const noexcept { return allocated_; }

private:
    [[nodiscard]] std::error_code open_truncated(std::string_view path) noexcept;
    [[nodiscard]] std::error_code pre_allocate(std::uint64_t size) noexcept;

    std::atomic<int> fd_{-1};
    std::string path_;
    std::uint64_t allocated_{0};
    std::uint64_t append_offset_{0};
};

// Accumulates stream bytes until a chunk is full
class ChunkBuffer {
public:
    explicit ChunkBuffer(std::size_t capacity);

    [[nodiscard]] const std::byte* data() const noexcept { return buffer_.data(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool full() const noexcept { return size_ == buffer_.size(); }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    void reset() noexcept { size_ = 0; }

    // Copy as much of [data, data+size) as fits; returns the number of bytes taken
    std::size_t fill(const void* data, std::size_t size) noexcept;

private:
    std::vector<std::byte> buffer_;
    std::size_t size_{0};
};

// Delete a partially written output; failures are reported, never thrown
[[nodiscard]] std::error_code remove_partial(const std::string& path) noexcept;

} // namespace splitdl::disk
