// Copyright (c) 2026 changcheng967. All rights reserved.

#include <xfer/core/chunk_status_logger.hpp>
#include <xfer/core/transition_event.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>

namespace xfer::core {

std::expected<std::unique_ptr<ChunkStatusLogger>, std::error_code>
ChunkStatusLogger::create(const ChunkStatusConfig& config) noexcept {
    std::unique_ptr<disk::ChunkEventLog> event_log;

    if (config.enable_output) {
        if (config.job_id.empty()) {
            return std::unexpected(make_error_code(ChunkStatusErrc::invalid_argument));
        }

        std::string path;
        try {
            path = log_path(config.log_dir, config.job_id);
        } catch (const std::exception& e) {
            spdlog::error("invalid chunk log location '{}': {}", config.log_dir, e.what());
            return std::unexpected(make_error_code(ChunkStatusErrc::log_open_failed));
        }

        auto opened = disk::ChunkEventLog::open(path, config.queue_capacity, config.close_poll_interval);
        if (!opened) {
            return std::unexpected(opened.error());
        }
        event_log = std::move(*opened);
        spdlog::info("job {}: logging chunk transitions to {}", config.job_id, path);
    }

    try {
        return std::unique_ptr<ChunkStatusLogger>(
            new ChunkStatusLogger(config.thresholds, std::move(event_log)));
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::string ChunkStatusLogger::log_path(std::string_view log_dir, std::string_view job_id) {
    std::string filename(job_id);
    filename += CHUNK_LOG_SUFFIX;
    return (std::filesystem::path(log_dir) / filename).string();
}

ChunkStatusLogger::ChunkStatusLogger(BottleneckThresholds thresholds,
                                     std::unique_ptr<disk::ChunkEventLog> event_log) noexcept
    : classifier_(thresholds)
    , event_log_(std::move(event_log)) {}

ChunkStatusLogger::~ChunkStatusLogger() {
    if (event_log_ && !event_log_->is_closed()) {
        if (auto ec = close_log()) {
            spdlog::warn("chunk log closed with error: {}", ec.message());
        }
    }
}

void ChunkStatusLogger::log_chunk_status(const ChunkId& chunk, WaitReason reason) noexcept {
    // In-memory counts are kept even with output disabled
    counter_.record(chunk, reason);

    if (!event_log_) {
        return;
    }

    try {
        event_log_->append(TransitionEvent{chunk.name(), chunk.offset(), reason,
                                           std::chrono::system_clock::now()});
    } catch (const std::bad_alloc&) {
        // Copying the name failed. A missing diagnostic row is acceptable.
    }
}

std::vector<ChunkStatusCount> ChunkStatusLogger::get_counts(bool is_download) const noexcept {
    return counter_.counts(is_download);
}

bool ChunkStatusLogger::is_disk_constrained(bool is_upload, bool is_download) const noexcept {
    return classifier_.disk_constrained(counter_.snapshot(), is_upload, is_download);
}

std::error_code ChunkStatusLogger::close_log() noexcept {
    if (!event_log_) {
        return {};
    }

    auto ec = event_log_->close();
    if (auto dropped = event_log_->dropped(); dropped > 0) {
        spdlog::debug("{} chunk transitions were not written (log closed or queue full)", dropped);
    }
    return ec;
}

} // namespace xfer::core
