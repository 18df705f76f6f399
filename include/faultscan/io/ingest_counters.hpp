#pragma once

#include <cstdint>


namespace faultscan{

    struct IngestCounters{
        // // every line handed to the pipeline, accepted or not
        std::uint64_t lines_total{0};

        // // lines the parser dropped (no marker, short, wrong handler, empty id, oversized)
        std::uint64_t lines_rejected{0};

        // // "02" records that bumped a healthy counter
        std::uint64_t records_healthy{0};

        // // "DD" records that moved a sensor to Faulty
        std::uint64_t records_faulty{0};

        // // accepted records with no effect: "02" after a fault, repeated "DD", any other state
        std::uint64_t records_ignored{0};

        bool operator==(const IngestCounters&) const = default;
    };


} // namespace faultscan
