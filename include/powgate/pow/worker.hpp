/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>

#include <powgate/crypto/bytes.hpp>
#include <powgate/crypto/hasher.hpp>
#include <powgate/logging/logger.hpp>
#include <powgate/pow/nonce.hpp>

namespace powgate {
namespace pow {

/**
 * State shared by the workers of one search: the stop flag checked at every
 * attempt boundary, the winning nonce, and the first error raised.
 */
class SearchState {
public:
    bool should_stop() const { return stop_.load(std::memory_order_relaxed); }

    // Stops the workers without recording a result or an error
    void request_stop() { stop_.store(true, std::memory_order_relaxed); }

    // First caller wins; later nonces are dropped. Raises the stop flag.
    void publish(const Nonce& nonce);

    // Records the first error and raises the stop flag.
    void fail(std::exception_ptr error);

    std::optional<Nonce> winner() const;

    // Rethrows the recorded error, if any
    void rethrow_if_failed() const;

private:
    std::atomic<bool> stop_{false};
    mutable std::mutex mutex_;
    std::optional<Nonce> winner_;
    std::exception_ptr error_;
};

/**
 * One search loop over a private nonce stream and a private share of the meter.
 */
class SearchWorker {
public:
    SearchWorker(int worker_id,
                 const crypto::Hasher& hasher,
                 crypto::ByteView payload,
                 std::uint32_t cost,
                 std::uint32_t budget,
                 NonceSource source,
                 SearchState& state,
                 logging::Logger* log = nullptr,
                 std::uint64_t progress_interval = 0);

    // Runs until a nonce is found, the budget is spent, or the state asks to stop.
    // Errors are recorded in the shared state, never thrown.
    void run();

    std::uint64_t attempts() const { return attempts_; }
    std::uint32_t budget() const { return budget_; }
    int id() const { return worker_id_; }

private:
    int worker_id_;
    const crypto::Hasher& hasher_;
    crypto::ByteView payload_;
    std::uint32_t cost_;
    std::uint32_t budget_;
    NonceSource source_;
    SearchState& state_;
    logging::Logger* log_;
    std::uint64_t progress_interval_;
    std::uint64_t attempts_ = 0;
};

} // namespace pow
} // namespace powgate
