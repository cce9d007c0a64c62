#pragma once

#include <string>
#include <vector>

#include <powgate/config/types.hpp>

namespace powgate::config {

// Read configuration from file (JSON or key=value). Missing file is not an error.
// Returns list of validation errors (empty if ok); cfg is left untouched on error.
std::vector<std::string> load_from_file(SolverConfig& cfg, const std::string& path);

// Apply POWGATE_* environment variables (ALGO, COST, METER, THREADS) on top of current cfg.
std::vector<std::string> apply_env_overrides(SolverConfig& cfg);

// Apply values given on the command line.
void apply_cli_overrides(SolverConfig& cfg, const CliOverrides& cli);

// Validate final config (algo supported, cost <= 256, thread count range).
std::vector<std::string> validate_final(const SolverConfig& cfg);

} // namespace powgate::config
