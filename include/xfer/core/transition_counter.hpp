// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <xfer/core/chunk_id.hpp>
#include <xfer/core/wait_reason.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <vector>

namespace xfer::core {

// Count of chunks currently waiting on one reason
struct ChunkStatusCount {
    WaitReason reason;
    std::int64_t count{0};
};

// Per-reason counts read one slot at a time. Slots may be read
// microseconds apart, so the whole is not a consistent cut.
struct CountSnapshot {
    std::array<std::int64_t, NUM_WAIT_REASONS> counts{};

    [[nodiscard]] std::int64_t operator[](WaitReason reason) const noexcept {
        return counts[static_cast<std::size_t>(reason.index)];
    }

    std::int64_t& operator[](WaitReason reason) noexcept {
        return counts[static_cast<std::size_t>(reason.index)];
    }
};

// Running totals of how many chunks are in each wait state.
// The previous state is kept in the ChunkId itself rather than in a
// lookup table, and the array is never locked, only its slots are
// updated atomically.
class TransitionCounter {
public:
    TransitionCounter() noexcept = default;

    TransitionCounter(const TransitionCounter&) = delete;
    TransitionCounter& operator=(const TransitionCounter&) = delete;

    // Move the chunk to new_reason. Returns the index it was waiting on before.
    std::int32_t record(const ChunkId& chunk, WaitReason new_reason) noexcept;

    [[nodiscard]] std::int64_t count(WaitReason reason) const noexcept;

    // Counts in reporting order for the direction, with re-reads rolled into Body
    [[nodiscard]] std::vector<ChunkStatusCount> counts(bool is_download) const noexcept;

    [[nodiscard]] CountSnapshot snapshot() const noexcept;

    // Chunks that have started and not reached Done or Cancelled
    [[nodiscard]] std::int64_t live_chunks() const noexcept;

private:
    std::array<std::atomic<std::int64_t>, NUM_WAIT_REASONS> counts_{};
};

} // namespace xfer::core
