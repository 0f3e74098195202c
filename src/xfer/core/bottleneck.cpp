// Copyright (c) 2026 changcheng967. All rights reserved.

#include <xfer/core/bottleneck.hpp>

namespace xfer::core {

BottleneckClassifier::BottleneckClassifier(BottleneckThresholds thresholds) noexcept
    : thresholds_(thresholds) {}

bool BottleneckClassifier::upload_disk_constrained(const CountSnapshot& counts) const noexcept {
    // Earlier states belong to chunk generation, not execution, so their counts
    // just track the scheduling pool size. Uploads only have this one useful queue.
    bool network_queue_small = counts[wait_reason::worker_slot] < thresholds_.near_zero_network_queue;

    // Queue size is irrelevant once nothing is being read from disk any more
    std::int64_t reading = counts[wait_reason::ram_to_schedule] + counts[wait_reason::disk_io];
    bool still_reading_disk = reading > 0;

    return still_reading_disk && network_queue_small;
}

bool BottleneckClassifier::download_disk_constrained(const CountSnapshot& counts) const noexcept {
    // Prior is left out: it may be waiting on the network or the service, we can't tell
    std::int64_t waiting_on_disk = counts[wait_reason::sorting] + counts[wait_reason::queue_to_write];
    std::int64_t waiting_on_network = counts[wait_reason::worker_slot];

    // The floor avoids false positives when both queues are near zero at the end of a job
    return waiting_on_disk > thresholds_.active_disk_queue
        && waiting_on_disk > thresholds_.disk_dominance_factor * waiting_on_network;
}

bool BottleneckClassifier::disk_constrained(const CountSnapshot& counts,
                                            bool is_upload,
                                            bool is_download) const noexcept {
    if (is_upload) {
        return upload_disk_constrained(counts);
    }
    if (is_download) {
        return download_disk_constrained(counts);
    }
    return false;
}

} // namespace xfer::core
