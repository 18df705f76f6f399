#include <cstdio>
#include <cstdarg>

#include "faultscan/core/time.hpp"
#include "log/stderr_logger.hpp"

namespace faultscan::tools::scan::log{
    void StderrLogger::log(LogLevel lvl, const char* msg, t_ns) noexcept{
        if (!enabled(lvl)) return;
        const std::string_view name = to_string(lvl);
        std::fprintf(stderr, "faultscan: %.*s: %s\n",
                     static_cast<int>(name.size()), name.data(), msg ? msg : "");
    }

    std::optional<LogLevel> parse_log_level(std::string_view s) noexcept{
        if (s == "trace") return LogLevel::kTrace;
        if (s == "debug") return LogLevel::kDebug;
        if (s == "info")  return LogLevel::kInfo;
        if (s == "warn")  return LogLevel::kWarn;
        if (s == "error") return LogLevel::kError;
        return std::nullopt;
    }

    void logf(LoggerSink* sink, LogLevel lvl, const char* fmt, ...) noexcept{
        if (!sink || !sink->enabled(lvl)) return;

        char msg[512];
        va_list ap;
        va_start(ap, fmt);
        std::vsnprintf(msg, sizeof(msg), fmt, ap);
        va_end(ap);

        sink->log(lvl, msg, now_mono_ns());
    }
} // namespace faultscan::tools::scan::log
