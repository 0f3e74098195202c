// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <xfer/core/config.hpp>
#include <xfer/disk/error.hpp>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace xfer::disk {

// Buffered, append-only file handle. Single writer.
class AppendFile {
public:
    // Create a fresh file, truncating any previous one
    static std::expected<AppendFile, std::error_code>
    create(std::string_view path, std::size_t buffer_size = core::EVENT_LOG_BUFFER_SIZE) noexcept;

    ~AppendFile();

    // Non-copyable, movable
    AppendFile(const AppendFile&) = delete;
    AppendFile& operator=(const AppendFile&) = delete;
    AppendFile(AppendFile&& other) noexcept;
    AppendFile& operator=(AppendFile&& other) noexcept;

    // Append to the buffer, writing it out when full
    [[nodiscard]] std::error_code append(std::string_view data) noexcept;

    // Write buffered data and sync it to disk
    [[nodiscard]] std::error_code flush() noexcept;

    // Flush and close. Returns the flush result.
    std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::size_t bytes_written() const noexcept { return bytes_written_; }

private:
    AppendFile() = default;

    // Write the buffer with ::write, retrying short writes and EINTR
    [[nodiscard]] std::error_code write_buffer() noexcept;

    int fd_{-1};
    std::string path_;
    std::vector<char> buffer_;
    std::size_t used_{0};
    std::size_t bytes_written_{0};
};

} // namespace xfer::disk
