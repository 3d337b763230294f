#include "MediaTypes.h"

#include <algorithm>

namespace mediadrop {

const char* MediaKindToString(MediaKind kind) {
    switch (kind) {
        case MediaKind::Image: return "image";
        case MediaKind::Audio: return "audio";
        case MediaKind::Video: return "video";
    }
    return "unknown";
}

const char* TransferOutcomeToString(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::NotStarted:       return "NotStarted";
        case TransferOutcome::Succeeded:        return "Succeeded";
        case TransferOutcome::FellBackToLegacy: return "FellBackToLegacy";
        case TransferOutcome::Failed:           return "Failed";
        case TransferOutcome::Cancelled:        return "Cancelled";
    }
    return "Unknown";
}

uint64_t ChunkPlan::PartLength(uint32_t part_index) const {
    uint64_t offset = PartOffset(part_index);
    if (offset >= total_bytes) {
        return 0;
    }
    return std::min(part_size_bytes, total_bytes - offset);
}

ChunkPlan ComputeChunkPlan(uint64_t total_bytes, uint64_t part_size_bytes) {
    if (part_size_bytes == 0) {
        throw std::invalid_argument("Part size must be positive");
    }
    if (total_bytes == 0) {
        throw std::invalid_argument("Cannot plan parts for an empty file");
    }

    ChunkPlan plan;
    plan.total_bytes = total_bytes;
    plan.part_size_bytes = part_size_bytes;
    plan.part_count = static_cast<uint32_t>((total_bytes + part_size_bytes - 1) / part_size_bytes);
    return plan;
}

size_t BatchOutcome::Count(TransferOutcome outcome) const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [outcome](const TransferResult& r) { return r.outcome == outcome; }));
}

} // namespace mediadrop
