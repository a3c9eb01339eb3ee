#include "continuation.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace partition_query {

namespace {

std::string requireString(const nlohmann::json& node, const char* field) {
    if (!node.contains(field)) {
        throw std::invalid_argument(
            std::string("Continuation entry missing '") + field + "'");
    }
    const auto& v = node[field];
    if (v.is_null()) return "";
    if (!v.is_string()) {
        throw std::invalid_argument(
            std::string("Continuation field '") + field + "' is not a string");
    }
    return v.get<std::string>();
}

} // namespace

std::string serializeContinuation(const std::vector<CompositeContinuationToken>& tokens) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& t : tokens) {
        // nlohmann::json objects are std::map backed: keys come out sorted.
        out.push_back({
            {"rangeId", t.rangeId},
            {"min",     t.min},
            {"max",     t.max},
            {"token",   t.token}
        });
    }
    return out.dump();
}

std::vector<CompositeContinuationToken> parseContinuation(const std::string& value) {
    std::vector<CompositeContinuationToken> tokens;
    if (value.empty()) return tokens;

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(value);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(
            std::string("Malformed continuation token: ") + e.what());
    }

    if (!parsed.is_array() || parsed.empty()) {
        throw std::invalid_argument(
            "Malformed continuation token: expected a non-empty array, got " + value);
    }

    for (const auto& entry : parsed) {
        if (!entry.is_object()) {
            throw std::invalid_argument(
                "Malformed continuation token: entry is not an object");
        }
        CompositeContinuationToken t;
        t.rangeId = requireString(entry, "rangeId");
        t.min     = requireString(entry, "min");
        t.max     = requireString(entry, "max");
        t.token   = entry.contains("token") ? requireString(entry, "token") : "";

        if (t.rangeId.empty()) {
            throw std::invalid_argument(
                "Malformed continuation token: empty range id");
        }
        if (!(t.min < t.max)) {
            throw std::invalid_argument(
                "Malformed continuation token: empty range [" + t.min + ", " + t.max + ")");
        }
        tokens.push_back(std::move(t));
    }
    return tokens;
}

} // namespace partition_query
