/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include <powgate/crypto/bytes.hpp>
#include <powgate/crypto/hasher.hpp>
#include <powgate/logging/logger.hpp>
#include <powgate/pow/nonce.hpp>

namespace powgate {
namespace pow {

struct SearchOptions {
    unsigned threads = 1;
    std::optional<std::uint64_t> seed;       // fixed seed for reproducible runs
    logging::Logger* log = nullptr;
    std::uint64_t progress_interval = 1u << 22;  // debug line every N attempts per worker, 0 = never
};

struct SearchOutcome {
    std::optional<Nonce> nonce;  // empty when the meter ran out
    std::uint64_t attempts = 0;
    std::chrono::nanoseconds elapsed{0};

    bool found() const { return nonce.has_value(); }
    double attempts_per_second() const;
};

/**
 * Bounded randomized nonce search.
 *
 * With one thread the search runs on the calling thread. With more, the
 * meter is split between worker threads that each draw from their own nonce
 * stream; the first worker to find a nonce stops the others. Any valid nonce
 * may be returned, not necessarily the first one generated.
 */
class Searcher {
public:
    // Throws std::invalid_argument if options.threads is 0
    explicit Searcher(const crypto::Hasher& hasher, SearchOptions options = {});

    // Never makes more than `meter` attempts in total. Errors raised by the
    // hasher or the nonce source are rethrown once all workers have stopped.
    SearchOutcome run(crypto::ByteView payload, std::uint32_t cost, std::uint32_t meter) const;

    // Worker i gets meter / workers, plus one if i < meter % workers
    static std::vector<std::uint32_t> partition_meter(std::uint32_t meter, unsigned workers);

private:
    const crypto::Hasher& hasher_;
    SearchOptions options_;
};

// Single-threaded search; std::nullopt after `meter` failed attempts.
std::optional<Nonce> search(const crypto::Hasher& hasher, crypto::ByteView payload,
                            std::uint32_t cost, std::uint32_t meter);

// SHA-256 variant
std::optional<Nonce> search(crypto::ByteView payload, std::uint32_t cost, std::uint32_t meter);

} // namespace pow
} // namespace powgate
