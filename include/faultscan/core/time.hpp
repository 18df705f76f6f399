#pragma once
#include <chrono>
#include <cstdint>

namespace faultscan{
    // // Standardized time unit across the scanner in nanoseconds

    using t_ns = std::int64_t;

    // monotonic stamp for log lines and run timing
    [[nodiscard]] inline t_ns now_mono_ns() noexcept{
        using namespace std::chrono;
        return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
    }

} // namespace faultscan
