/*
 * powgate command line
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <powgate/cli/app.hpp>
#include <powgate/cli/args.hpp>
#include <powgate/logging/fmt_logger.hpp>

int main(int argc, char** argv) {
    powgate::logging::FmtLogger log;
    auto args = powgate::cli::parse(argc, argv, log);
    if (args.show_only) {
        return powgate::cli::kExitOk;
    }
    if (!args.ok) {
        return powgate::cli::kExitUsage;
    }
    log.set_debug(args.debug);
    return powgate::cli::run(args, log);
}
