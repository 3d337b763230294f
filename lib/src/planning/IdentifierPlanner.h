#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "MediaTypes.h"

namespace mediadrop {

struct PlanRequest {
    std::vector<MediaItem> files;
    std::optional<std::vector<std::string>> explicit_ids;  // Must match files.size() when present
    int pad_width = 3;                                     // Clamped to >= 1
    uint64_t start_index = 0;                              // Seed for the sequential counter
    bool infer_from_name = false;
};

/**
 * IdentifierPlanner
 *
 * Assigns every input file a logical ID that is unique within the batch,
 * so no two files are written to the same storage key.
 *
 * ID sources, in priority order:
 * 1. Explicit IDs (one per file)
 * 2. Trailing digit run of the file's base name ("card_007.jpg" -> "007")
 * 3. Sequential counter padded to pad_width
 *
 * Collisions are resolved by incrementing numeric IDs ("007" -> "008") and
 * suffixing non-numeric ones ("intro" -> "introa"). When IDs were inferred
 * the plan is sorted by numeric value so the bucket listing stays in
 * ordinal order.
 */
class IdentifierPlanner {
public:
    /**
     * Build the plan
     * @param request Files and ID options
     * @return One entry per file
     * @throws PlanningError if explicit_ids is present with the wrong length
     */
    static std::vector<PlanEntry> Plan(const PlanRequest& request);

    /**
     * Trailing digit run of a file name, ignoring the extension
     * @return "" if the base name does not end in a digit
     */
    static std::string ExtractTrailingDigits(const std::string& filename);

    /// True for a non-empty string of ASCII digits
    static bool IsNumericId(const std::string& id);

    /// Left-pad with zeros up to width; never truncates
    static std::string PadId(const std::string& id, size_t width);

    /// Decimal string + 1, preserving leading zeros up to min_width ("009" -> "010", "99" -> "100")
    static std::string IncrementNumericId(const std::string& id, size_t min_width);

    /**
     * Total order used for the inferred-ID sort: numeric IDs ascending by value,
     * then non-numeric IDs lexicographically
     */
    static bool IdLess(const std::string& a, const std::string& b);

private:
    static std::string ResolveCollision(std::string candidate, size_t pad_width,
                                        const std::set<std::string>& used);
};

} // namespace mediadrop
