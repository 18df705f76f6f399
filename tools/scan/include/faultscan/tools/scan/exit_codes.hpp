#pragma once
#include <cstdint>

#include "faultscan/core/status.hpp"

namespace faultscan::tools::scan{
    // explicit type: enum size is stable across ABIs
    enum class ExitCode: std::int32_t{
        // success
        kOk = 0,

        // input log missing or could not be opened
        kOpenFail = 1,

        // input opened but reading it failed midway
        kReadFail = 2,

        // unknown flag or bad flag value
        kBadArgs = 3,

        // JSON report could not be written
        kWriteFail = 4
    };

    // safe cast for returning from main
    [[nodiscard]] inline constexpr int to_int(ExitCode e) noexcept{
        return static_cast<int>(e);
    }

    [[nodiscard]] inline constexpr bool is_ok(ExitCode e) noexcept{
        return e == ExitCode::kOk;
    }

    // // failure of the scan itself (not of writing its outputs)
    [[nodiscard]] inline constexpr ExitCode from_scan_status(Status s) noexcept{
        switch (s){
            case Status::kOK:         return ExitCode::kOk;
            case Status::kNotFound:   return ExitCode::kOpenFail;
            case Status::kInvalidArg: return ExitCode::kBadArgs;
            default:                  return ExitCode::kReadFail;
        }
    }
} // namespace faultscan::tools::scan
