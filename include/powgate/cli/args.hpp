#pragma once

#include <powgate/config/types.hpp>
#include <powgate/logging/logger.hpp>

namespace powgate::cli {

// Parse CLI using cxxopts. Writes help/version through provided logger when requested.
powgate::config::ParseResult parse(int argc, char** argv, powgate::logging::Logger& log);

} // namespace powgate::cli
