// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <xfer/core/bottleneck.hpp>
#include <xfer/core/chunk_id.hpp>
#include <xfer/core/config.hpp>
#include <xfer/core/error.hpp>
#include <xfer/core/transition_counter.hpp>
#include <xfer/core/wait_reason.hpp>
#include <xfer/disk/chunk_event_log.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace xfer::core {

// What chunk-execution code sees: report each lifecycle boundary
class ChunkStatusSink {
public:
    virtual ~ChunkStatusSink() = default;

    // Hot path. Never blocks, never fails, never throws.
    virtual void log_chunk_status(const ChunkId& chunk, WaitReason reason) noexcept = 0;
};

// Per-job chunk status configuration
struct ChunkStatusConfig {
    std::string job_id;
    std::string log_dir;
    bool enable_output{false};                          // Write every transition to <log_dir>/<job_id>-chunks.log
    std::size_t queue_capacity{EVENT_QUEUE_CAPACITY};
    std::chrono::milliseconds close_poll_interval{CLOSE_POLL_INTERVAL};
    BottleneckThresholds thresholds;
};

// Records all chunk state transitions for one job, keeps the aggregate
// counts available immediately, and optionally logs every transition to file.
class ChunkStatusLogger final : public ChunkStatusSink {
public:
    // Fails only when output is enabled and the log cannot be created
    static std::expected<std::unique_ptr<ChunkStatusLogger>, std::error_code>
    create(const ChunkStatusConfig& config) noexcept;

    // "<dir>/<job_id>-chunks.log". A CSV, named .log like the job's other logs.
    [[nodiscard]] static std::string log_path(std::string_view log_dir, std::string_view job_id);

    ~ChunkStatusLogger() override;

    ChunkStatusLogger(const ChunkStatusLogger&) = delete;
    ChunkStatusLogger& operator=(const ChunkStatusLogger&) = delete;

    void log_chunk_status(const ChunkId& chunk, WaitReason reason) noexcept override;

    [[nodiscard]] std::int64_t count(WaitReason reason) const noexcept { return counter_.count(reason); }

    // Counts in the order chunks pass through the states for the direction
    [[nodiscard]] std::vector<ChunkStatusCount> get_counts(bool is_download) const noexcept;

    [[nodiscard]] bool is_disk_constrained(bool is_upload, bool is_download) const noexcept;

    // Call once no more transitions will be logged. Returns once every
    // accepted event is on disk, or the log's write error.
    std::error_code close_log() noexcept;

    // Transitions the log rejected (closed or full). Always 0 with output disabled.
    [[nodiscard]] std::uint64_t dropped_events() const noexcept {
        return event_log_ ? event_log_->dropped() : 0;
    }

    [[nodiscard]] bool output_enabled() const noexcept { return event_log_ != nullptr; }
    [[nodiscard]] const TransitionCounter& counter() const noexcept { return counter_; }
    [[nodiscard]] const BottleneckClassifier& classifier() const noexcept { return classifier_; }

    // Null when output is disabled
    [[nodiscard]] const disk::ChunkEventLog* event_log() const noexcept { return event_log_.get(); }

private:
    ChunkStatusLogger(BottleneckThresholds thresholds,
                      std::unique_ptr<disk::ChunkEventLog> event_log) noexcept;

    TransitionCounter counter_;
    BottleneckClassifier classifier_;
    std::unique_ptr<disk::ChunkEventLog> event_log_;
};

} // namespace xfer::core
