#include "models.hpp"
#include "http_constants.hpp"

namespace partition_query {

bool KeyRange::isEmpty() const {
    if (min > max) return true;
    if (min == max) return !(isMinInclusive && isMaxInclusive);
    return false;
}

bool KeyRange::contains(const std::string& key) const {
    const bool aboveMin = isMinInclusive ? key >= min : key > min;
    const bool belowMax = isMaxInclusive ? key <= max : key < max;
    return aboveMin && belowMax;
}

bool KeyRange::overlaps(const KeyRange& other) const {
    if (isEmpty() || other.isEmpty()) return false;

    // this ends before other starts?
    if (max < other.min) return false;
    if (max == other.min && !(isMaxInclusive && other.isMinInclusive)) return false;

    // other ends before this starts?
    if (other.max < min) return false;
    if (other.max == min && !(other.isMaxInclusive && isMinInclusive)) return false;

    return true;
}

bool KeyRange::covers(const KeyRange& other) const {
    if (other.isEmpty()) return true;

    const bool minOk = (min < other.min)
        || (min == other.min && (isMinInclusive || !other.isMinInclusive));
    const bool maxOk = (max > other.max)
        || (max == other.max && (isMaxInclusive || !other.isMaxInclusive));
    return minOk && maxOk;
}

bool isPartitioned(ResourceType type) {
    return type == ResourceType::Document || type == ResourceType::Conflict;
}

const char* toString(ResourceType type) {
    switch (type) {
        case ResourceType::Document:   return "Document";
        case ResourceType::Conflict:   return "Conflict";
        case ResourceType::Collection: return "Collection";
        case ResourceType::Database:   return "Database";
        case ResourceType::Offer:      return "Offer";
    }
    return "Unknown";
}

std::string FeedResponse::responseContinuation() const {
    return header(headers::kContinuation);
}

} // namespace partition_query
