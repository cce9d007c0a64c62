/*
 * powgate command dispatch
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <powgate/cli/app.hpp>

#include <chrono>
#include <exception>

#include <fmt/core.h>
#include <fmt/format.h>

#include <powgate/config/loader.hpp>
#include <powgate/crypto/difficulty.hpp>
#include <powgate/crypto/hasher.hpp>
#include <powgate/pow/proof.hpp>
#include <powgate/pow/search.hpp>

namespace powgate::cli {

namespace {

int run_search(const powgate::config::SolverConfig& cfg,
               const powgate::config::ParseResult& args,
               const powgate::crypto::Hasher& hasher,
               powgate::logging::Logger& log) {
    powgate::pow::SearchOptions options;
    options.threads = cfg.threads;
    options.seed = args.seed;
    options.log = &log;

    log.debug(fmt::format("Expected attempts at cost {}: {:.0f}, success probability within meter: {:.4f}",
                          cfg.cost, powgate::crypto::expected_attempts(cfg.cost),
                          powgate::crypto::success_probability(cfg.cost, cfg.meter)));

    powgate::pow::Searcher searcher(hasher, options);
    auto outcome = searcher.run(args.payload, cfg.cost, cfg.meter);

    log.info(fmt::format("{} attempts in {:.3f}s ({:.0f} attempts/s)", outcome.attempts,
                         std::chrono::duration<double>(outcome.elapsed).count(),
                         outcome.attempts_per_second()));
    if (!outcome.found()) {
        log.warn(fmt::format("No nonce with {} leading zero bits within {} attempts", cfg.cost, cfg.meter));
        return kExitNoProof;
    }
    fmt::print("{}\n", powgate::pow::nonce_to_hex(*outcome.nonce));
    return kExitOk;
}

int run_verify(const powgate::config::SolverConfig& cfg,
               const powgate::config::ParseResult& args,
               const powgate::crypto::Hasher& hasher,
               powgate::logging::Logger& log) {
    auto nonce = powgate::pow::nonce_from_hex(*args.nonce_hex);
    if (!nonce) {
        log.error(fmt::format("--nonce must be {} hex characters", 2 * powgate::pow::kNonceSize));
        return kExitUsage;
    }
    const bool valid = powgate::pow::verify(hasher, args.payload, *nonce, cfg.cost);
    fmt::print("{}\n", valid ? "valid" : "invalid");
    return valid ? kExitOk : kExitNoProof;
}

} // namespace

std::vector<std::string> resolve_config(const powgate::config::ParseResult& args,
                                        powgate::config::SolverConfig& cfg) {
    auto errs = powgate::config::load_from_file(cfg, args.config_path);
    if (!errs.empty()) return errs;
    errs = powgate::config::apply_env_overrides(cfg);
    if (!errs.empty()) return errs;
    powgate::config::apply_cli_overrides(cfg, args.overrides);
    return powgate::config::validate_final(cfg);
}

int run(const powgate::config::ParseResult& args, powgate::logging::Logger& log) {
    if (!args.ok || args.command == powgate::config::Command::None) {
        return kExitUsage;
    }

    powgate::config::SolverConfig cfg;
    auto errs = resolve_config(args, cfg);
    if (!errs.empty()) {
        for (const auto& e : errs) log.error(e);
        return kExitUsage;
    }

    log.debug(fmt::format("algo={} cost={} meter={} threads={}", cfg.algo, cfg.cost, cfg.meter, cfg.threads));

    try {
        auto hasher = powgate::crypto::make_hasher(cfg.algo);
        if (args.command == powgate::config::Command::Search) {
            return run_search(cfg, args, *hasher, log);
        }
        return run_verify(cfg, args, *hasher, log);
    } catch (const std::exception& e) {
        log.error(e.what());
        return kExitUsage;
    }
}

} // namespace powgate::cli
