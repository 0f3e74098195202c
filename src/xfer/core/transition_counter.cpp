// Copyright (c) 2026 changcheng967. All rights reserved.

#include <xfer/core/transition_counter.hpp>
#include <cassert>

namespace xfer::core {

namespace {

constexpr auto NUM_SLOTS = static_cast<std::int32_t>(NUM_WAIT_REASONS);

constexpr bool is_reread(WaitReason reason) noexcept {
    return reason == wait_reason::body_reread_low_memory
        || reason == wait_reason::body_reread_slow;
}

} // namespace

std::int32_t TransitionCounter::record(const ChunkId& chunk, WaitReason new_reason) noexcept {
    std::int32_t old_index = chunk.exchange_wait_reason(new_reason.index);

    // Index 0 is the initial "Nothing" state, which is never counted
    if (old_index > 0 && old_index < NUM_SLOTS) {
        [[maybe_unused]] auto before =
            counts_[static_cast<std::size_t>(old_index)].fetch_sub(1, std::memory_order_relaxed);
        assert(before > 0 && "wait reason count went negative");
    }
    if (new_reason.index > 0 && new_reason.index < NUM_SLOTS) {
        counts_[static_cast<std::size_t>(new_reason.index)].fetch_add(1, std::memory_order_relaxed);
    }
    return old_index;
}

std::int64_t TransitionCounter::count(WaitReason reason) const noexcept {
    if (reason.index < 0 || reason.index >= NUM_SLOTS) return 0;
    return counts_[static_cast<std::size_t>(reason.index)].load(std::memory_order_relaxed);
}

std::vector<ChunkStatusCount> TransitionCounter::counts(bool is_download) const noexcept {
    auto reasons = reporting_wait_reasons(is_download);

    std::vector<ChunkStatusCount> result;
    result.reserve(reasons.size());
    for (const auto& reason : reasons) {
        assert(!is_reread(reason) && "body re-reads are rolled into Body, never reported directly");

        std::int64_t n = count(reason);
        if (reason == wait_reason::body) {
            n += count(wait_reason::body_reread_low_memory);
            n += count(wait_reason::body_reread_slow);
        }
        result.push_back({reason, n});
    }
    return result;
}

CountSnapshot TransitionCounter::snapshot() const noexcept {
    CountSnapshot snap;
    for (std::size_t i = 0; i < counts_.size(); ++i) {
        snap.counts[i] = counts_[i].load(std::memory_order_relaxed);
    }
    return snap;
}

std::int64_t TransitionCounter::live_chunks() const noexcept {
    std::int64_t total = 0;
    for (const auto& reason : ALL_WAIT_REASONS) {
        if (reason.terminal()) continue;
        total += count(reason);
    }
    return total;
}

} // namespace xfer::core
