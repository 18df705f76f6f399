#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <utility>

#include "faultscan/core/types.hpp"

namespace faultscan{
    struct FaultyDevice{
        std::string sensor_id;
        FaultReason reason{FaultReason::Unknown};

        bool operator==(const FaultyDevice&) const = default;
    };

    struct HealthyDevice{
        std::string sensor_id;
        std::uint64_t count{0};

        bool operator==(const HealthyDevice&) const = default;
    };

    // // End-of-stream result of one aggregation run. Immutable once built.
    // // faulty_devices is in first "DD" order, healthy_devices in first "02" order;
    // // the two id sets never overlap.
    struct Summary{
        std::uint64_t total_devices{0};
        std::uint64_t healthy_count{0};
        std::uint64_t faulty_count{0};

        std::vector<FaultyDevice>  faulty_devices;
        std::vector<HealthyDevice> healthy_devices;

        bool operator==(const Summary&) const = default;
    };

} // namespace faultscan
