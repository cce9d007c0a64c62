/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powgate/pow/worker.hpp"
#include "powgate/crypto/difficulty.hpp"
#include "powgate/pow/proof.hpp"

#include <utility>

#include <fmt/format.h>

namespace powgate {
namespace pow {

void SearchState::publish(const Nonce& nonce) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!winner_) {
            winner_ = nonce;
        }
    }
    stop_.store(true, std::memory_order_relaxed);
}

void SearchState::fail(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_) {
            error_ = std::move(error);
        }
    }
    stop_.store(true, std::memory_order_relaxed);
}

std::optional<Nonce> SearchState::winner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return winner_;
}

void SearchState::rethrow_if_failed() const {
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        error = error_;
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

SearchWorker::SearchWorker(int worker_id,
                           const crypto::Hasher& hasher,
                           crypto::ByteView payload,
                           std::uint32_t cost,
                           std::uint32_t budget,
                           NonceSource source,
                           SearchState& state,
                           logging::Logger* log,
                           std::uint64_t progress_interval)
    : worker_id_(worker_id)
    , hasher_(hasher)
    , payload_(payload)
    , cost_(cost)
    , budget_(budget)
    , source_(std::move(source))
    , state_(state)
    , log_(log)
    , progress_interval_(progress_interval) {}

void SearchWorker::run() {
    if (log_) {
        log_->debug(fmt::format("Worker {} starting: cost {}, budget {}", worker_id_, cost_, budget_));
    }

    try {
        Nonce nonce{};
        while (attempts_ < budget_ && !state_.should_stop()) {
            source_.fill(nonce);
            ++attempts_;

            if (crypto::meets_cost(proof_digest(hasher_, nonce, payload_), cost_)) {
                state_.publish(nonce);
                if (log_) {
                    log_->debug(fmt::format("Worker {} found nonce {} after {} attempts",
                                            worker_id_, nonce_to_hex(nonce), attempts_));
                }
                return;
            }

            if (log_ && progress_interval_ != 0 && attempts_ % progress_interval_ == 0) {
                log_->debug(fmt::format("Worker {}: {} / {} attempts", worker_id_, attempts_, budget_));
            }
        }
    } catch (const std::exception& e) {
        if (log_) {
            log_->error(fmt::format("Worker {} error: {}", worker_id_, e.what()));
        }
        state_.fail(std::current_exception());
        return;
    }

    if (log_) {
        log_->debug(fmt::format("Worker {} finished after {} attempts ({})", worker_id_, attempts_,
                                state_.should_stop() ? "stopped" : "budget spent"));
    }
}

} // namespace pow
} // namespace powgate
