/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powgate/pow/search.hpp"
#include "powgate/pow/thread_group.hpp"
#include "powgate/pow/worker.hpp"

#include <memory>
#include <stdexcept>

#include <fmt/format.h>

namespace powgate {
namespace pow {

double SearchOutcome::attempts_per_second() const {
    const double secs = std::chrono::duration<double>(elapsed).count();
    if (secs <= 0.0) return 0.0;
    return static_cast<double>(attempts) / secs;
}

Searcher::Searcher(const crypto::Hasher& hasher, SearchOptions options)
    : hasher_(hasher)
    , options_(options) {
    if (options_.threads == 0) {
        throw std::invalid_argument("Searcher needs at least one thread");
    }
}

std::vector<std::uint32_t> Searcher::partition_meter(std::uint32_t meter, unsigned workers) {
    std::vector<std::uint32_t> shares;
    if (workers == 0) return shares;

    shares.reserve(workers);
    const std::uint32_t base = meter / workers;
    const std::uint32_t extra = meter % workers;
    for (unsigned i = 0; i < workers; ++i) {
        shares.push_back(base + (i < extra ? 1u : 0u));
    }
    return shares;
}

SearchOutcome Searcher::run(crypto::ByteView payload, std::uint32_t cost, std::uint32_t meter) const {
    const auto start = std::chrono::steady_clock::now();
    logging::Logger* log = options_.log;

    SearchState state;
    std::vector<std::unique_ptr<SearchWorker>> workers;
    const auto shares = partition_meter(meter, options_.threads);
    for (unsigned i = 0; i < shares.size(); ++i) {
        if (shares[i] == 0) continue;  // meter smaller than thread count
        NonceSource source = options_.seed ? NonceSource(*options_.seed, i) : NonceSource(i);
        workers.push_back(std::make_unique<SearchWorker>(
            static_cast<int>(i), hasher_, payload, cost, shares[i], std::move(source), state,
            log, options_.progress_interval));
    }

    if (log) {
        log->debug(fmt::format("Searching with {}: cost {}, meter {}, {} worker(s)",
                               hasher_.name(), cost, meter, workers.size()));
    }

    if (workers.size() == 1) {
        workers.front()->run();
    } else if (!workers.empty()) {
        // Declared after state and workers so it joins before they go away
        ThreadGroup group([&state] { state.request_stop(); });
        for (auto& w : workers) {
            SearchWorker* worker = w.get();
            group.spawn([worker] { worker->run(); });
        }
        group.join_all();
    }

    state.rethrow_if_failed();

    SearchOutcome outcome;
    outcome.nonce = state.winner();
    for (const auto& w : workers) {
        outcome.attempts += w->attempts();
    }
    outcome.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);
    return outcome;
}

std::optional<Nonce> search(const crypto::Hasher& hasher, crypto::ByteView payload,
                            std::uint32_t cost, std::uint32_t meter) {
    return Searcher(hasher).run(payload, cost, meter).nonce;
}

std::optional<Nonce> search(crypto::ByteView payload, std::uint32_t cost, std::uint32_t meter) {
    return search(crypto::default_hasher(), payload, cost, meter);
}

} // namespace pow
} // namespace powgate
