#pragma once
#include <cstdint>
#include <variant>

#include "faultscan/core/types.hpp"

namespace faultscan{
    // // Sensor reported "02" and never "DD" so far
    struct Healthy{
        std::uint64_t count{0};
    };

    // // Sensor reported "DD" at least once. Reason frozen from the first one
    struct Faulty{
        FaultReason reason{FaultReason::Unknown};

        // position of this sensor among faulty sensors (first "DD" order)
        std::uint64_t fault_seq{0};
    };

    // // Per sensor state. Unseen sensors simply have no entry.
    // // Transitions: none -> Healthy, none -> Faulty, Healthy -> Faulty. Never Faulty -> Healthy.
    using DeviceState = std::variant<Healthy, Faulty>;

    [[nodiscard]] inline bool is_faulty(const DeviceState& s) noexcept{
        return std::holds_alternative<Faulty>(s);
    }

} // namespace faultscan
