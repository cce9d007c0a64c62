#include <powgate/logging/fmt_logger.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>

#include <fmt/core.h>
#include <fmt/format.h>

namespace powgate::logging {

std::string FmtLogger::now_hms() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return fmt::format("[{:02d}:{:02d}:{:02d}]", tm.tm_hour, tm.tm_min, tm.tm_sec);
}

static inline void print_line(std::FILE* out, std::string_view level, std::string_view msg) {
    // One call per line so concurrent workers do not interleave mid-line
    fmt::print(out, "{} [{}] {}\n", FmtLogger::now_hms(), level, msg);
}

void FmtLogger::info(std::string_view msg) { print_line(stdout, "INFO", msg); }
void FmtLogger::warn(std::string_view msg) { print_line(stdout, "WARN", msg); }
void FmtLogger::error(std::string_view msg) { print_line(stderr, "ERROR", msg); }
void FmtLogger::debug(std::string_view msg) {
    if (enable_debug_.load()) print_line(stdout, "DEBUG", msg);
}

} // namespace powgate::logging
