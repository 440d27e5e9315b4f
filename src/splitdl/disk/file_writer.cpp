// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>

namespace splitdl::disk {

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

std::error_code FileWriter::open_truncated(std::string_view path) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    // path_ names only files this writer actually created or truncated
    std::string target;
    try {
        target = std::string(path);
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::allocation_failed);
    }

    int fd = ::open(target.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }

    path_ = std::move(target);
    fd_.store(fd, std::memory_order_release);
    allocated_ = 0;
    append_offset_ = 0;
    return {};
}

std::error_code FileWriter::open_presized(std::string_view path, std::uint64_t size) noexcept {
    if (auto ec = open_truncated(path)) {
        return ec;
    }

    if (size > 0) {
        if (auto ec = pre_allocate(size)) {
            close();
            return ec;
        }
    }
    return {};
}

std::error_code FileWriter::open_stream(std::string_view path) noexcept {
    return open_truncated(path);
}

std::error_code FileWriter::pre_allocate(std::uint64_t size) noexcept {
    int fd = fd_.load(std::memory_order_acquire);

    int rc = ::posix_fallocate(fd, 0, static_cast<off_t>(size));
    if (rc == 0) {
        allocated_ = size;
        return {};
    }

    if (rc != EOPNOTSUPP && rc != EINVAL && rc != ENOSYS) {
        return errno_to_error_code(rc, DiskErrc::allocation_failed);
    }

    // Filesystem cannot allocate: extend by writing the final byte
    spdlog::debug("posix_fallocate unsupported for {}, writing last byte", path_);
    const char zero = 0;
    ssize_t n = ::pwrite(fd, &zero, 1, static_cast<off_t>(size - 1));
    if (n != 1) {
        return errno_to_error_code(errno, DiskErrc::allocation_failed);
    }
    allocated_ = size;
    return {};
}

std::error_code FileWriter::write_at(std::uint64_t offset,
                                     const void* data,
                                     std::size_t size) noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* bytes = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::pwrite(fd, bytes, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno, DiskErrc::write_error);
        }
        bytes += n;
        offset += static_cast<std::uint64_t>(n);
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code FileWriter::append(const void* data, std::size_t size) noexcept {
    auto ec = write_at(append_offset_, data, size);
    if (!ec) {
        append_offset_ += size;
    }
    return ec;
}

std::error_code FileWriter::flush() noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd) != 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    // Atomic guard against double-close
    int fd = fd_.exchange(-1, std::memory_order_acq_rel);
    if (fd >= 0) {
        ::close(fd);
    }
}

//=============================================================================
// ChunkBuffer
//=============================================================================

ChunkBuffer::ChunkBuffer(std::size_t capacity)
    : buffer_(std::max<std::size_t>(capacity, 1)) {}

std::size_t ChunkBuffer::fill(const void* data, std::size_t size) noexcept {
    std::size_t take = std::min(size, buffer_.size() - size_);
    std::memcpy(buffer_.data() + size_, data, take);
    size_ += take;
    return take;
}

//=============================================================================
// Cleanup
//=============================================================================

std::error_code remove_partial(const std::string& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        spdlog::warn("Could not remove partial file {}: {}", path, ec.message());
    }
    return ec;
}

} // namespace splitdl::disk
