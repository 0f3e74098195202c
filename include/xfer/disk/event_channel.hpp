// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <xfer/core/error.hpp>
#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <mutex>
#include <new>
#include <vector>

namespace xfer::disk {

// Multi-producer, single-consumer channel that can be closed.
// Senders never wait: a closed or full channel rejects the value.
// The consumer drains what is left after close, then sees end-of-stream.
template<typename T>
class EventChannel {
public:
    explicit EventChannel(std::size_t capacity) noexcept
        : capacity_(capacity) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    [[nodiscard]] std::expected<void, std::error_code> try_send(T value) noexcept {
        {
            auto lock = std::lock_guard(mutex_);
            if (closed_) {
                return std::unexpected(make_error_code(core::ChunkStatusErrc::log_closed));
            }
            if (items_.size() >= capacity_) {
                return std::unexpected(make_error_code(core::ChunkStatusErrc::queue_full));
            }
            try {
                items_.push_back(std::move(value));
            } catch (const std::bad_alloc&) {
                return std::unexpected(make_error_code(core::ChunkStatusErrc::queue_full));
            }
        }
        cv_.notify_one();
        return {};
    }

    // Wait for values and move up to max_items of them into out.
    // Returns 0 only once the channel is closed and empty.
    std::size_t receive(std::vector<T>& out, std::size_t max_items) {
        auto lock = std::unique_lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });

        std::size_t n = std::min(max_items, items_.size());
        for (std::size_t i = 0; i < n; ++i) {
            out.push_back(std::move(items_.front()));
            items_.pop_front();
        }
        return n;
    }

    void close() noexcept {
        {
            auto lock = std::lock_guard(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool closed() const noexcept {
        auto lock = std::lock_guard(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        auto lock = std::lock_guard(mutex_);
        return items_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::deque<T> items_;
    std::size_t capacity_;
    bool closed_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace xfer::disk
