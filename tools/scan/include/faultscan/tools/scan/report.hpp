#pragma once

#include <string>
#include <cstdint>
#include <optional>

#include "faultscan/core/time.hpp"
#include "faultscan/core/summary.hpp"
#include "faultscan/io/ingest_counters.hpp"

namespace faultscan::tools::scan{
    /// @brief version attestation for the tool and library
    struct Manifest{
        std::string scan_version;
        std::string faultscan_version;
    };

    /// @brief what was read
    struct InputEntry{
        // as given on the command line ("-" for stdin)
        std::string path;

        // bytes consumed from the stream
        std::uint64_t size_bytes{0};

        // hex BLAKE3-256 of the payload; absent when built without BLAKE3
        std::optional<std::string> payload_blake3;
    };

    /// @brief full result of one scan run
    struct Report{
        Manifest        manifest{};
        InputEntry      input{};
        IngestCounters  counters{};
        Summary         summary{};

        // wall time of the read-parse-fold loop
        t_ns            elapsed_ns{0};
    };
} // namespace faultscan::tools::scan
