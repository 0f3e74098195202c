// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <xfer/core/error.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

namespace xfer::core {

// The one thing a chunk is waiting on at a given moment.
// Equality is by index only, names are for display.
struct WaitReason {
    std::int32_t index{0};
    std::string_view name{"Nothing"};

    [[nodiscard]] constexpr bool operator==(const WaitReason& other) const noexcept {
        return index == other.index;
    }

    [[nodiscard]] constexpr bool terminal() const noexcept;
};

// Indices follow the typical lifetime of a chunk (Head sits between Worker and Body)
namespace wait_reason {

inline constexpr WaitReason nothing{0, "Nothing"};                           // Not waiting for anything
inline constexpr WaitReason ram_to_schedule{1, "RAM"};                      // Enough RAM to schedule the chunk
inline constexpr WaitReason worker_slot{2, "Worker"};                       // A worker to pick up the chunk
inline constexpr WaitReason header_response{3, "Head"};                     // Response headers
inline constexpr WaitReason body{4, "Body"};                                // Sending/receiving the body
inline constexpr WaitReason body_reread_low_memory{5, "BodyReRead-LowRam"}; // Body re-read after forced retry on low RAM
inline constexpr WaitReason body_reread_slow{6, "BodyReRead-TooSlow"};      // Body re-read after forced retry on a slow read
inline constexpr WaitReason sorting{7, "Sorting"};                          // Writer to sort the chunk into sequence
inline constexpr WaitReason prior_chunk{8, "Prior"};                        // A prior chunk to arrive
inline constexpr WaitReason queue_to_write{9, "Queue"};                     // Sorted, not yet written out
inline constexpr WaitReason disk_io{10, "DiskIO"};                          // Disk read/write to complete
inline constexpr WaitReason chunk_done{11, "Done"};                         // Finished
inline constexpr WaitReason cancelled{12, "Cancelled"};                     // Transfer cancelled. Must stay last.

} // namespace wait_reason

constexpr bool WaitReason::terminal() const noexcept {
    return index == wait_reason::chunk_done.index || index == wait_reason::cancelled.index;
}

inline constexpr std::size_t NUM_WAIT_REASONS =
    static_cast<std::size_t>(wait_reason::cancelled.index) + 1;

inline constexpr std::array<WaitReason, NUM_WAIT_REASONS> ALL_WAIT_REASONS{
    wait_reason::nothing,
    wait_reason::ram_to_schedule,
    wait_reason::worker_slot,
    wait_reason::header_response,
    wait_reason::body,
    wait_reason::body_reread_low_memory,
    wait_reason::body_reread_slow,
    wait_reason::sorting,
    wait_reason::prior_chunk,
    wait_reason::queue_to_write,
    wait_reason::disk_io,
    wait_reason::chunk_done,
    wait_reason::cancelled,
};

// States an upload chunk goes through, in order. Done/Cancelled are not reported.
inline constexpr std::array<WaitReason, 4> UPLOAD_WAIT_REASONS{
    // These two happen while generating chunk work, so are bounded by the scheduling pool
    wait_reason::ram_to_schedule,
    wait_reason::disk_io,

    // Queue of work waiting to go out over the network
    wait_reason::worker_slot,

    // Network activity. Headers are not separated out for uploads.
    wait_reason::body,
};

// Download chunks also need re-assembling into sequential order
inline constexpr std::array<WaitReason, 8> DOWNLOAD_WAIT_REASONS{
    wait_reason::ram_to_schedule,

    // Queue of work waiting for its network download to start
    wait_reason::worker_slot,

    // Network activity. Re-reads are rolled into body.
    wait_reason::header_response,
    wait_reason::body,

    // Sorting and Queue are the queue waiting on disk. Prior waits on the network.
    wait_reason::sorting,
    wait_reason::prior_chunk,
    wait_reason::queue_to_write,

    wait_reason::disk_io,
};

namespace detail {

constexpr bool indices_contiguous() noexcept {
    for (std::size_t i = 0; i < ALL_WAIT_REASONS.size(); ++i) {
        if (ALL_WAIT_REASONS[i].index != static_cast<std::int32_t>(i)) return false;
    }
    return ALL_WAIT_REASONS.back() == wait_reason::cancelled;
}

template<std::size_t N>
constexpr bool reportable(const std::array<WaitReason, N>& reasons) noexcept {
    for (const auto& r : reasons) {
        if (r.index <= 0 || r.index >= static_cast<std::int32_t>(NUM_WAIT_REASONS)) return false;
        if (r == wait_reason::body_reread_low_memory || r == wait_reason::body_reread_slow) return false;
        if (r.terminal()) return false;
    }
    return true;
}

} // namespace detail

static_assert(detail::indices_contiguous(), "wait reason indices must be contiguous from 0, ending with Cancelled");
static_assert(detail::reportable(UPLOAD_WAIT_REASONS), "upload report sequence holds an unreportable reason");
static_assert(detail::reportable(DOWNLOAD_WAIT_REASONS), "download report sequence holds an unreportable reason");

// Report sequence for the given direction
[[nodiscard]] std::span<const WaitReason> reporting_wait_reasons(bool is_download) noexcept;

[[nodiscard]] std::expected<WaitReason, std::error_code>
wait_reason_from_index(std::int32_t index) noexcept;

// Lookup by display name, as written to the chunk log
[[nodiscard]] std::expected<WaitReason, std::error_code>
wait_reason_from_name(std::string_view name) noexcept;

} // namespace xfer::core
