#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace faultscan{
    // // Literal values the log format is built around
    inline constexpr std::string_view kLineMarker   = "> ";
    inline constexpr std::string_view kBigHandler   = "BIG";
    inline constexpr std::string_view kStateHealthy = "02";
    inline constexpr std::string_view kStateFaulty  = "DD";

    // // minimum ';' separated fields for a BIG message
    inline constexpr std::size_t kMinFields = 18;

    // // field positions inside a BIG message
    inline constexpr std::size_t kFieldHandler  = 0;
    inline constexpr std::size_t kFieldSensorId = 2;
    inline constexpr std::size_t kFieldSp1      = 6;
    inline constexpr std::size_t kFieldSp2      = 15;

    // // One accepted BIG message. Produced by parse_line, consumed once by the aggregator
    struct Record{
        // upper-cased, never empty
        std::string sensor_id;

        // packed status field 1 (last char is a checksum)
        std::string sp1;

        // packed status field 2 (may carry leading '-')
        std::string sp2;

        // second-to-last field: "02", "DD" or anything else
        std::string state;

        bool operator==(const Record&) const = default;
    };

    // // Dominant fault named by the decoder, one per faulty device
    enum class FaultReason : std::uint8_t{
        Battery = 0,
        Temperature = 1,
        Threshold = 2,
        Unknown = 3
    };

    static_assert(sizeof(FaultReason) == 1, "FaultReason must be 1 byte");

    [[nodiscard]] inline constexpr std::string_view to_string(FaultReason r) noexcept{
        switch (r){
            case FaultReason::Battery:     return "Battery device error";
            case FaultReason::Temperature: return "Temperature device error";
            case FaultReason::Threshold:   return "Threshold central error";
            case FaultReason::Unknown:     return "Unknown device error";
        }
        return "Unknown device error";
    }

} // namespace faultscan
