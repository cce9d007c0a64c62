/*
 * powgate command dispatch
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#pragma once

#include <string>
#include <vector>

#include <powgate/config/types.hpp>
#include <powgate/logging/logger.hpp>

namespace powgate::cli {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;     // bad arguments or configuration
constexpr int kExitNoProof = 2;   // search exhausted, or proof invalid

// defaults < config file < environment < command line. Returns config errors.
std::vector<std::string> resolve_config(const powgate::config::ParseResult& args,
                                        powgate::config::SolverConfig& cfg);

// Runs a parsed search/verify command. Results go to stdout, diagnostics to log.
int run(const powgate::config::ParseResult& args, powgate::logging::Logger& log);

} // namespace powgate::cli
