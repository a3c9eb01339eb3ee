#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace partition_query {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::chrono::milliseconds computeBackoffMs(int attempt, int64_t baseMs, int64_t maxMs) {
    // Exponential: base * 2^attempt, clamped to maxMs.
    attempt = std::min(attempt, 30);
    int64_t backoff = baseMs * (int64_t{1} << attempt);
    backoff = std::min(backoff, maxMs);

    // Jitter: uniform random in [0, 100] ms.
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int64_t> jitter(0, 100);
    backoff += jitter(rng);

    return std::chrono::milliseconds(backoff);
}

std::optional<bool> tryParseBool(const std::string& value) {
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::nullopt;
    auto last = value.find_last_not_of(" \t\r\n");

    std::string trimmed = value.substr(first, last - first + 1);
    std::transform(trimmed.begin(), trimmed.end(), trimmed.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (trimmed == "true")  return true;
    if (trimmed == "false") return false;
    return std::nullopt;
}

std::string effectivePartitionKey(const std::string& partitionKeyValue) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : partitionKeyValue) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    // Top bit cleared so every key sorts below the "FF" upper bound.
    hash &= 0x7FFFFFFFFFFFFFFFULL;

    std::ostringstream out;
    out << std::uppercase << std::hex << std::setw(16) << std::setfill('0') << hash;
    return out.str();
}

std::string utcTimestamp() {
    const auto now   = std::chrono::system_clock::now();
    const auto secs  = std::chrono::system_clock::to_time_t(now);
    const auto milli = std::chrono::duration_cast<std::chrono::milliseconds>(
                           now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&secs, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << milli << 'Z';
    return out.str();
}

} // namespace partition_query
