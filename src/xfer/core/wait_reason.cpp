// Copyright (c) 2026 changcheng967. All rights reserved.

#include <xfer/core/wait_reason.hpp>
#include <algorithm>

namespace xfer::core {

std::span<const WaitReason> reporting_wait_reasons(bool is_download) noexcept {
    if (is_download) {
        return DOWNLOAD_WAIT_REASONS;
    }
    return UPLOAD_WAIT_REASONS;
}

std::expected<WaitReason, std::error_code>
wait_reason_from_index(std::int32_t index) noexcept {
    if (index < 0 || index >= static_cast<std::int32_t>(NUM_WAIT_REASONS)) {
        return std::unexpected(make_error_code(ChunkStatusErrc::invalid_reason));
    }
    return ALL_WAIT_REASONS[static_cast<std::size_t>(index)];
}

std::expected<WaitReason, std::error_code>
wait_reason_from_name(std::string_view name) noexcept {
    auto it = std::ranges::find(ALL_WAIT_REASONS, name, &WaitReason::name);
    if (it == ALL_WAIT_REASONS.end()) {
        return std::unexpected(make_error_code(ChunkStatusErrc::invalid_reason));
    }
    return *it;
}

} // namespace xfer::core
