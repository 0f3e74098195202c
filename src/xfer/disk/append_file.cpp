// Copyright (c) 2026 changcheng967. All rights reserved.

#include <xfer/disk/append_file.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace xfer::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENOTDIR:
        case EISDIR:
        case ENAMETOOLONG:  return make_error_code(DiskErrc::invalid_path);
        case EEXIST:        return make_error_code(DiskErrc::file_exists);
        case EMFILE:
        case ENFILE:        return make_error_code(DiskErrc::too_many_open_files);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// AppendFile
//=============================================================================

std::expected<AppendFile, std::error_code>
AppendFile::create(std::string_view path, std::size_t buffer_size) noexcept {
    if (path.empty()) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    AppendFile file;
    try {
        file.path_ = path;
        file.buffer_.resize(buffer_size > 0 ? buffer_size : 1);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    file.fd_ = ::open(file.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (file.fd_ < 0) {
        return std::unexpected(errno_to_error_code(errno));
    }
    return file;
}

AppendFile::~AppendFile() {
    close();
}

AppendFile::AppendFile(AppendFile&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_))
    , buffer_(std::move(other.buffer_))
    , used_(other.used_)
    , bytes_written_(other.bytes_written_) {
    other.fd_ = -1;
    other.used_ = 0;
}

AppendFile& AppendFile::operator=(AppendFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        buffer_ = std::move(other.buffer_);
        used_ = other.used_;
        bytes_written_ = other.bytes_written_;
        other.fd_ = -1;
        other.used_ = 0;
    }
    return *this;
}

std::error_code AppendFile::append(std::string_view data) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    while (!data.empty()) {
        std::size_t n = std::min(data.size(), buffer_.size() - used_);
        std::memcpy(buffer_.data() + used_, data.data(), n);
        used_ += n;
        data.remove_prefix(n);

        if (used_ == buffer_.size()) {
            if (auto ec = write_buffer()) {
                return ec;
            }
        }
    }
    return {};
}

std::error_code AppendFile::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (auto ec = write_buffer()) {
        return ec;
    }
    if (::fsync(fd_) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

std::error_code AppendFile::close() noexcept {
    if (fd_ < 0) {
        return {};
    }

    std::error_code ec = flush();
    if (::close(fd_) != 0 && !ec) {
        ec = errno_to_error_code(errno);
    }
    fd_ = -1;
    return ec;
}

std::error_code AppendFile::write_buffer() noexcept {
    std::size_t done = 0;
    while (done < used_) {
        ssize_t n = ::write(fd_, buffer_.data() + done, used_ - done);
        if (n < 0) {
            int err = errno;
            if (err == EINTR) continue;
            // Keep what was not written so a later flush can retry
            std::memmove(buffer_.data(), buffer_.data() + done, used_ - done);
            used_ -= done;
            return errno_to_error_code(err);
        }
        done += static_cast<std::size_t>(n);
        bytes_written_ += static_cast<std::size_t>(n);
    }
    used_ = 0;
    return {};
}

} // namespace xfer::disk
