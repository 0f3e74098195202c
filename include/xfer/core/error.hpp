// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace xfer::core {

enum class ChunkStatusErrc {
    success = 0,
    log_open_failed,
    log_write_failed,
    log_closed,
    queue_full,
    invalid_reason,
    malformed_record,
    invalid_argument,
};

namespace detail {

struct ChunkStatusErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "xfer::chunk_status";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<ChunkStatusErrc>(ev)) {
            case ChunkStatusErrc::success:           return "Success";
            case ChunkStatusErrc::log_open_failed:   return "Could not create chunk log";
            case ChunkStatusErrc::log_write_failed:  return "Could not write chunk log";
            case ChunkStatusErrc::log_closed:        return "Chunk log already closed";
            case ChunkStatusErrc::queue_full:        return "Chunk event queue full";
            case ChunkStatusErrc::invalid_reason:    return "Unknown wait reason";
            case ChunkStatusErrc::malformed_record:  return "Malformed chunk log record";
            case ChunkStatusErrc::invalid_argument:  return "Invalid argument";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ChunkStatusErrcCategory& chunk_status_errc_category() noexcept {
    static detail::ChunkStatusErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ChunkStatusErrc e) noexcept {
    return {static_cast<int>(e), chunk_status_errc_category()};
}

} // namespace xfer::core

namespace std {

template<>
struct is_error_code_enum<xfer::core::ChunkStatusErrc> : true_type {};

} // namespace std
