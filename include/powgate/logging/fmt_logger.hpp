#pragma once

#include <powgate/logging/logger.hpp>

#include <atomic>
#include <string>

namespace powgate::logging {

// Writes "[HH:MM:SS] [LEVEL] msg" lines; errors go to stderr.
class FmtLogger : public Logger {
public:
    explicit FmtLogger(bool enable_debug = false) : enable_debug_(enable_debug) {}
    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;
    bool debug_enabled() const override { return enable_debug_.load(); }

    void set_debug(bool v) { enable_debug_.store(v); }

    static std::string now_hms();

private:
    std::atomic<bool> enable_debug_{false};
};

} // namespace powgate::logging
