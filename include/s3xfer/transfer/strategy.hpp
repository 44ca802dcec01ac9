#pragma once

#include "s3xfer/transfer/types.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace s3xfer::transfer {

// Pure decision functions. No I/O; everything here is a function of sizes
// and options so that it can be tested in isolation.

struct SinglePart {};
struct Multipart {
    uint64_t part_size = 0;
    uint32_t part_count = 0;
};
using UploadStrategy = std::variant<SinglePart, Multipart>;

/// size <= threshold -> SinglePart, otherwise Multipart with an adjusted part size.
UploadStrategy choose_upload_strategy(uint64_t size, const TransferOptions& options);

/// Grow `requested` (never shrink it) until `size` fits in MAX_PART_COUNT
/// parts, and never go below `min_part_size`.
uint64_t adjust_part_size(uint64_t size, uint64_t requested, uint64_t min_part_size);

uint32_t part_count(uint64_t size, uint64_t part_size);

/// Half-open byte range [start, end)
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t length() const { return end - start; }
    bool operator==(const ByteRange&) const = default;
};
using RangePlan = std::vector<ByteRange>;

/// Consecutive ranges of `chunk_size` covering [0, size); the last may be short.
RangePlan plan_ranges(uint64_t size, uint64_t chunk_size);

struct SingleStream {};
struct Ranged {
    RangePlan plan;
};
using DownloadStrategy = std::variant<SingleStream, Ranged>;

DownloadStrategy choose_download_strategy(uint64_t size, const TransferOptions& options);

struct ServerSide {};
struct TwoPhase {
    std::string reason;
};
using CopyStrategy = std::variant<ServerSide, TwoPhase>;

CopyStrategy choose_copy_strategy(uint64_t source_size,
                                  uint64_t max_server_side_size = constants::MAX_SERVER_SIDE_COPY_SIZE);

const char* strategy_name(const UploadStrategy& strategy);
const char* strategy_name(const DownloadStrategy& strategy);
const char* strategy_name(const CopyStrategy& strategy);

}  // namespace s3xfer::transfer
