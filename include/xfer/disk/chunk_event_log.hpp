// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <xfer/core/config.hpp>
#include <xfer/core/transition_event.hpp>
#include <xfer/disk/append_file.hpp>
#include <xfer/disk/event_channel.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace xfer::disk {

// Persists chunk transitions to a CSV file without blocking the callers.
// One background thread owns the file and drains the event channel.
class ChunkEventLog {
public:
    // Create the file (truncating any old one), write the header, start the writer.
    // Failure to create the file is returned, never degraded to a no-op.
    static std::expected<std::unique_ptr<ChunkEventLog>, std::error_code>
    open(std::string_view path,
         std::size_t capacity = core::EVENT_QUEUE_CAPACITY,
         std::chrono::milliseconds close_poll_interval = core::CLOSE_POLL_INTERVAL) noexcept;

    ~ChunkEventLog();

    ChunkEventLog(const ChunkEventLog&) = delete;
    ChunkEventLog& operator=(const ChunkEventLog&) = delete;

    // Queue an event. Rejected events (log closed, queue full) are dropped and counted.
    void append(core::TransitionEvent event) noexcept;

    // Stop accepting events and wait until everything accepted is on disk.
    // Returns the first write error seen by the writer. Safe to call twice.
    std::error_code close() noexcept;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t written() const noexcept { return written_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::size_t pending() const noexcept { return channel_.size(); }
    [[nodiscard]] bool is_closed() const noexcept { return closed_.load(std::memory_order_acquire); }

private:
    ChunkEventLog(AppendFile file, std::size_t capacity,
                  std::chrono::milliseconds close_poll_interval);

    // Writer thread body
    void write_loop() noexcept;

    std::string path_;
    AppendFile file_;  // Touched only by the writer thread once started
    EventChannel<core::TransitionEvent> channel_;
    std::chrono::milliseconds close_poll_interval_;
    std::vector<core::TransitionEvent> batch_;  // Writer thread only

    std::atomic<std::uint64_t> written_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<bool> closed_{false};
    std::atomic<bool> writer_done_{false};
    std::error_code write_error_;  // Published by writer_done_

    std::jthread writer_;
};

} // namespace xfer::disk
