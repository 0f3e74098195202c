// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <xfer/core/wait_reason.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace xfer::core {

// Identifies a chunk: file name plus byte offset within that file.
// Copies share one wait-reason cell, so a transition recorded through any copy
// is seen by all of them. Two chunks constructed separately never share a cell,
// even for the same (name, offset).
class ChunkId {
public:
    ChunkId(std::string name, std::int64_t offset);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::int64_t offset() const noexcept { return offset_; }

    // Index of the reason this chunk is waiting on now
    [[nodiscard]] std::int32_t wait_reason_index() const noexcept {
        return cell_->load(std::memory_order_acquire);
    }

    // Swap in a new reason and return the previous one, in one atomic step
    std::int32_t exchange_wait_reason(std::int32_t index) const noexcept {
        return cell_->exchange(index, std::memory_order_acq_rel);
    }

    // True if both are copies of the same chunk
    [[nodiscard]] bool shares_state_with(const ChunkId& other) const noexcept {
        return cell_ == other.cell_;
    }

private:
    std::string name_;
    std::int64_t offset_;
    std::shared_ptr<std::atomic<std::int32_t>> cell_;
};

} // namespace xfer::core
