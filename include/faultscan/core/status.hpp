#pragma once

#include <cstdint>

namespace faultscan{
    enum class Status : std::uint8_t{
        kOK = 0,
        kInvalidArg,
        kNotFound,
        kIoError,
        kDecodeFault,
    };

    [[nodiscard]] inline constexpr const char* to_string(Status s) noexcept{
        switch (s){
            case Status::kOK:          return "ok";
            case Status::kInvalidArg:  return "invalid argument";
            case Status::kNotFound:    return "not found";
            case Status::kIoError:     return "i/o error";
            case Status::kDecodeFault: return "decode fault";
        }
        return "unknown";
    }

} // namespace faultscan
