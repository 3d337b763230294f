#include "IdentifierPlanner.h"

#include <algorithm>
#include <cctype>

namespace mediadrop {

namespace {

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Numeric value comparison on digit strings of any length
int CompareNumeric(const std::string& a, const std::string& b) {
    size_t a_start = a.find_first_not_of('0');
    size_t b_start = b.find_first_not_of('0');
    std::string a_digits = (a_start == std::string::npos) ? std::string() : a.substr(a_start);
    std::string b_digits = (b_start == std::string::npos) ? std::string() : b.substr(b_start);

    if (a_digits.size() != b_digits.size()) {
        return a_digits.size() < b_digits.size() ? -1 : 1;
    }
    return a_digits.compare(b_digits);
}

} // namespace

std::string IdentifierPlanner::ExtractTrailingDigits(const std::string& filename) {
    std::string base = filename;

    size_t slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }

    size_t dot = base.rfind('.');
    if (dot != std::string::npos) {
        base = base.substr(0, dot);
    }

    size_t end = base.size();
    size_t start = end;
    while (start > 0 && IsDigit(base[start - 1])) {
        --start;
    }
    return base.substr(start, end - start);
}

bool IdentifierPlanner::IsNumericId(const std::string& id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), IsDigit);
}

std::string IdentifierPlanner::PadId(const std::string& id, size_t width) {
    if (id.size() >= width) {
        return id;
    }
    return std::string(width - id.size(), '0') + id;
}

std::string IdentifierPlanner::IncrementNumericId(const std::string& id, size_t min_width) {
    std::string result = id;

    int i = static_cast<int>(result.size()) - 1;
    while (i >= 0) {
        if (result[i] == '9') {
            result[i] = '0';
            --i;
        } else {
            ++result[i];
            break;
        }
    }
    if (i < 0) {
        result.insert(result.begin(), '1');
    }

    return PadId(result, std::max(min_width, id.size()));
}

bool IdentifierPlanner::IdLess(const std::string& a, const std::string& b) {
    bool a_numeric = IsNumericId(a);
    bool b_numeric = IsNumericId(b);

    if (a_numeric && b_numeric) {
        return CompareNumeric(a, b) < 0;
    }
    if (a_numeric != b_numeric) {
        return a_numeric;  // Numeric IDs first
    }
    return a < b;
}

std::string IdentifierPlanner::ResolveCollision(std::string candidate, size_t pad_width,
                                                const std::set<std::string>& used) {
    while (used.count(candidate) > 0) {
        if (IsNumericId(candidate)) {
            candidate = IncrementNumericId(candidate, pad_width);
        } else {
            candidate += 'a';
        }
    }
    return candidate;
}

std::vector<PlanEntry> IdentifierPlanner::Plan(const PlanRequest& request) {
    const auto& files = request.files;
    const size_t pad = static_cast<size_t>(std::max(1, request.pad_width));

    const std::vector<std::string>* explicit_ids = nullptr;
    if (request.explicit_ids) {
        if (request.explicit_ids->size() != files.size()) {
            throw PlanningError("Explicit ID count (" + std::to_string(request.explicit_ids->size()) +
                                ") does not match file count (" + std::to_string(files.size()) + ")");
        }
        explicit_ids = &*request.explicit_ids;
    }

    const bool inferring = request.infer_from_name && explicit_ids == nullptr;

    std::vector<PlanEntry> plan;
    plan.reserve(files.size());
    std::set<std::string> used;
    uint64_t seq = request.start_index;

    for (size_t i = 0; i < files.size(); ++i) {
        std::string candidate;

        if (explicit_ids) {
            candidate = (*explicit_ids)[i];
        } else if (inferring) {
            std::string digits = ExtractTrailingDigits(files[i].Name());
            if (!digits.empty()) {
                candidate = PadId(digits, pad);
            }
        }

        if (candidate.empty()) {
            candidate = PadId(std::to_string(seq), pad);
            ++seq;
        }

        candidate = ResolveCollision(std::move(candidate), pad, used);
        used.insert(candidate);

        PlanEntry entry;
        entry.item = files[i];
        entry.logical_id = std::move(candidate);
        entry.source_index = i;
        plan.push_back(std::move(entry));
    }

    if (inferring) {
        std::stable_sort(plan.begin(), plan.end(), [](const PlanEntry& a, const PlanEntry& b) {
            return IdLess(a.logical_id, b.logical_id);
        });
    }

    return plan;
}

} // namespace mediadrop
