// Copyright (c) 2026 changcheng967. All rights reserved.

#include <xfer/disk/chunk_event_log.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace xfer::disk {

std::expected<std::unique_ptr<ChunkEventLog>, std::error_code>
ChunkEventLog::open(std::string_view path,
                    std::size_t capacity,
                    std::chrono::milliseconds close_poll_interval) noexcept {
    if (capacity == 0) {
        return std::unexpected(make_error_code(core::ChunkStatusErrc::invalid_argument));
    }

    auto file = AppendFile::create(path);
    if (!file) {
        spdlog::error("cannot create chunk log {}: {}", path, file.error().message());
        return std::unexpected(file.error());
    }

    std::unique_ptr<ChunkEventLog> log;
    try {
        log.reset(new ChunkEventLog(std::move(*file), capacity, close_poll_interval));
        log->batch_.reserve(std::min(capacity, core::EVENT_DRAIN_BATCH));
        log->writer_ = std::jthread([raw = log.get()] { raw->write_loop(); });
    } catch (const std::exception& e) {
        spdlog::error("cannot start chunk log writer for {}: {}", path, e.what());
        return std::unexpected(make_error_code(core::ChunkStatusErrc::log_open_failed));
    }

    spdlog::debug("chunk log {} opened", path);
    return log;
}

ChunkEventLog::ChunkEventLog(AppendFile file, std::size_t capacity,
                             std::chrono::milliseconds close_poll_interval)
    : path_(file.path())
    , file_(std::move(file))
    , channel_(capacity)
    , close_poll_interval_(close_poll_interval) {}

ChunkEventLog::~ChunkEventLog() {
    // Everything queued still reaches disk
    if (auto ec = close()) {
        spdlog::warn("chunk log {} closed with error: {}", path_, ec.message());
    }
}

void ChunkEventLog::append(core::TransitionEvent event) noexcept {
    // A send after close is an expected shutdown race. Losing trailing rows is fine.
    if (!channel_.try_send(std::move(event))) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
    }
}

std::error_code ChunkEventLog::close() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        // Second caller still waits for the first to finish draining
        while (!writer_done_.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(close_poll_interval_);
        }
        return write_error_;
    }

    channel_.close();

    // The writer may never have started if open() failed half-way
    if (writer_.joinable()) {
        while (!writer_done_.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(close_poll_interval_);
        }
        writer_.join();
    } else {
        write_error_ = file_.close();
        writer_done_.store(true, std::memory_order_release);
    }

    spdlog::debug("chunk log {} closed: {} events written, {} dropped",
                  path_, written(), dropped());
    return write_error_;
}

void ChunkEventLog::write_loop() noexcept {
    std::string lines;

    auto record_error = [this](std::error_code ec) {
        if (ec && !write_error_) {
            write_error_ = ec;
            spdlog::error("chunk log {} write failed: {}", path_, ec.message());
        }
    };

    std::string header(core::CHUNK_LOG_HEADER);
    header += '\n';
    record_error(file_.append(header));

    // Drain until closed and empty. Keep draining after an error so close() returns.
    // batch_ was reserved up front, so receive() never allocates.
    for (;;) {
        batch_.clear();
        std::size_t n = channel_.receive(batch_, batch_.capacity());
        if (n == 0) {
            break;
        }
        if (write_error_) {
            continue;
        }

        try {
            lines.clear();
            for (const auto& event : batch_) {
                core::append_event_line(lines, event);
            }
        } catch (const std::bad_alloc&) {
            record_error(make_error_code(core::ChunkStatusErrc::log_write_failed));
            continue;
        }

        if (auto ec = file_.append(lines)) {
            record_error(ec);
            continue;
        }
        written_.fetch_add(n, std::memory_order_relaxed);
    }

    record_error(file_.close());
    writer_done_.store(true, std::memory_order_release);
}

} // namespace xfer::disk
