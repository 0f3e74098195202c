// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <xfer/core/config.hpp>
#include <xfer/core/transition_counter.hpp>
#include <cstdint>

namespace xfer::core {

// Thresholds for the disk-vs-network heuristics
struct BottleneckThresholds {
    std::int64_t near_zero_network_queue{NEAR_ZERO_NETWORK_QUEUE};
    std::int64_t active_disk_queue{ACTIVE_DISK_QUEUE_THRESHOLD};
    std::int64_t disk_dominance_factor{DISK_DOMINANCE_FACTOR};
};

// Decides from live wait-state counts whether disk is what limits a job.
// Only measures. Acting on the answer is up to the throttling controller.
class BottleneckClassifier {
public:
    explicit BottleneckClassifier(BottleneckThresholds thresholds = {}) noexcept;

    // Disk is still being read but almost nothing is queued for the network
    [[nodiscard]] bool upload_disk_constrained(const CountSnapshot& counts) const noexcept;

    // Far more chunks queued for disk than for the network
    [[nodiscard]] bool download_disk_constrained(const CountSnapshot& counts) const noexcept;

    // False when neither flag is set (service-to-service copies have no local disk leg)
    [[nodiscard]] bool disk_constrained(const CountSnapshot& counts,
                                        bool is_upload,
                                        bool is_download) const noexcept;

    [[nodiscard]] const BottleneckThresholds& thresholds() const noexcept { return thresholds_; }

private:
    BottleneckThresholds thresholds_;
};

} // namespace xfer::core
