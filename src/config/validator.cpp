#include <powgate/config/validator.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <powgate/crypto/hasher.hpp>

namespace powgate::config {

bool parse_u32(const std::string& text, std::uint32_t& value, std::string& err) {
    if (text.empty()) { err = "empty number"; return false; }
    if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        err = fmt::format("'{}' must contain only digits", text); return false; }
    if (text.size() > 10) { err = fmt::format("'{}' is out of range", text); return false; }
    unsigned long long v = std::stoull(text);
    if (v > std::numeric_limits<std::uint32_t>::max()) {
        err = fmt::format("'{}' is out of range", text); return false; }
    value = static_cast<std::uint32_t>(v);
    return true;
}

bool is_valid_cost(std::uint32_t cost, std::string& err) {
    if (cost > crypto::kDigestBits) {
        err = fmt::format("cost {} exceeds the digest size ({} bits)", cost, crypto::kDigestBits);
        return false;
    }
    return true;
}

bool is_valid_threads(std::uint32_t threads, std::string& err) {
    if (threads == 0 || threads > kMaxThreads) {
        err = fmt::format("threads must be in range 1-{}", kMaxThreads);
        return false;
    }
    return true;
}

bool is_valid_algo(const std::string& algo, std::string& err) {
    if (!crypto::is_supported_algorithm(algo)) {
        err = fmt::format("algo '{}' is not supported (expected one of: {})", algo,
                          fmt::join(crypto::supported_algorithms(), ", "));
        return false;
    }
    return true;
}

} // namespace powgate::config
