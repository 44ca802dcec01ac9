#include "s3xfer/transfer/strategy.hpp"

#include <algorithm>

namespace s3xfer::transfer {

uint64_t adjust_part_size(uint64_t size, uint64_t requested, uint64_t min_part_size) {
    uint64_t part_size = std::max<uint64_t>({requested, min_part_size, 1});

    // Grow to the smallest size that keeps the part count within the limit
    uint64_t needed = (size + constants::MAX_PART_COUNT - 1) / constants::MAX_PART_COUNT;
    part_size = std::max(part_size, needed);

    return std::min(part_size, constants::MAX_PART_SIZE);
}

uint32_t part_count(uint64_t size, uint64_t part_size) {
    if (part_size == 0) return 0;
    return static_cast<uint32_t>((size + part_size - 1) / part_size);
}

UploadStrategy choose_upload_strategy(uint64_t size, const TransferOptions& options) {
    if (size <= options.upload_multipart_threshold) {
        return SinglePart{};
    }
    Multipart multipart;
    multipart.part_size = adjust_part_size(size, options.part_size, options.min_part_size);
    multipart.part_count = part_count(size, multipart.part_size);
    return multipart;
}

RangePlan plan_ranges(uint64_t size, uint64_t chunk_size) {
    RangePlan plan;
    if (size == 0) return plan;
    chunk_size = std::max<uint64_t>(chunk_size, 1);
    plan.reserve(static_cast<size_t>((size + chunk_size - 1) / chunk_size));
    for (uint64_t start = 0; start < size; start += chunk_size) {
        plan.push_back(ByteRange{start, std::min(start + chunk_size, size)});
    }
    return plan;
}

DownloadStrategy choose_download_strategy(uint64_t size, const TransferOptions& options) {
    if (size <= options.download_multipart_threshold) {
        return SingleStream{};
    }
    return Ranged{plan_ranges(size, options.download_chunk_size)};
}

CopyStrategy choose_copy_strategy(uint64_t source_size, uint64_t max_server_side_size) {
    if (source_size > max_server_side_size) {
        return TwoPhase{"source exceeds server-side copy limit"};
    }
    return ServerSide{};
}

const char* strategy_name(const UploadStrategy& strategy) {
    return std::holds_alternative<SinglePart>(strategy) ? "single-part" : "multipart";
}

const char* strategy_name(const DownloadStrategy& strategy) {
    return std::holds_alternative<SingleStream>(strategy) ? "single-stream" : "ranged";
}

const char* strategy_name(const CopyStrategy& strategy) {
    return std::holds_alternative<ServerSide>(strategy) ? "server-side" : "two-phase";
}

}  // namespace s3xfer::transfer
