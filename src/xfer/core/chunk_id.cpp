// Copyright (c) 2026 changcheng967. All rights reserved.

#include <xfer/core/chunk_id.hpp>
#include <utility>

namespace xfer::core {

ChunkId::ChunkId(std::string name, std::int64_t offset)
    : name_(std::move(name))
    , offset_(offset)
    , cell_(std::make_shared<std::atomic<std::int32_t>>(wait_reason::nothing.index)) {}

} // namespace xfer::core
