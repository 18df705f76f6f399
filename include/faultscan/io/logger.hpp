#pragma once

#include <string_view>

#include "faultscan/core/time.hpp"

namespace faultscan{
    enum class LogLevel {
        kTrace,
        kDebug,
        kInfo,
        kWarn,
        kError
    };

    [[nodiscard]] inline constexpr std::string_view to_string(LogLevel lvl) noexcept{
        switch (lvl){
            case LogLevel::kTrace: return "trace";
            case LogLevel::kDebug: return "debug";
            case LogLevel::kInfo:  return "info";
            case LogLevel::kWarn:  return "warn";
            case LogLevel::kError: return "error";
        }
        return "info";
    }

    // // Where library diagnostics go. Passing a null sink anywhere means "stay silent".
    struct LoggerSink{
        virtual ~LoggerSink() = default;

        // cheap pre-check so callers can skip formatting messages nobody reads
        [[nodiscard]] virtual bool enabled(LogLevel lvl) const noexcept = 0;

        virtual void log(LogLevel lvl, const char *msg, t_ns t) noexcept = 0;
    };

} // namespace faultscan
