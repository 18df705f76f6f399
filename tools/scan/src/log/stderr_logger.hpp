#pragma once

#include <optional>
#include <string_view>

#include "faultscan/io/logger.hpp"

namespace faultscan::tools::scan::log{
    // // "faultscan: <level>: <msg>" on stderr, below min_level dropped
    class StderrLogger final : public LoggerSink{
        public:
            explicit StderrLogger(LogLevel min_level = LogLevel::kWarn) noexcept : min_(min_level){}

            [[nodiscard]] bool enabled(LogLevel lvl) const noexcept override{
                return static_cast<int>(lvl) >= static_cast<int>(min_);
            }

            void log(LogLevel lvl, const char* msg, t_ns t) noexcept override;

        private:
            LogLevel min_;
    };

    // "trace" | "debug" | "info" | "warn" | "error"
    [[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view s) noexcept;

    // printf into any sink; no-op for a null or disabled sink. Messages are cut at 512 bytes
#if defined(__GNUC__) || defined(__clang__)
    void logf(LoggerSink* sink, LogLevel lvl, const char* fmt, ...) noexcept __attribute__((format(printf, 3, 4)));
#else
    void logf(LoggerSink* sink, LogLevel lvl, const char* fmt, ...) noexcept;
#endif

} // namespace faultscan::tools::scan::log
