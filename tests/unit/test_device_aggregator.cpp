#include <vector>
#include <string>
#include <cassert>
#include <variant>

#include "faultscan/core/types.hpp"
#include "faultscan/core/summary.hpp"
#include "faultscan/core/device_state.hpp"
#include "faultscan/aggregate/device_aggregator.hpp"

using namespace faultscan;
using namespace faultscan::aggregate;

static Record rec(const char* id, const char* state, const char* sp1 = "12", const char* sp2 = "03"){
    return Record{id, sp1, sp2, state};
}

int main(){
    // Case 1: single healthy record
    {
        DeviceAggregator agg;
        if (agg.fold(rec("AB", "02")) != FoldOutcome::kHealthyCounted) return 1;
        const Summary s = agg.summary();
        if (s.total_devices != 1 || s.healthy_count != 1 || s.faulty_count != 0) return 2;
        if (s.healthy_devices.size() != 1) return 3;
        if (s.healthy_devices[0].sensor_id != "AB" || s.healthy_devices[0].count != 1) return 4;
    }

    // Case 2: counts accumulate, first-appearance order kept
    {
        DeviceAggregator agg;
        (void)agg.fold(rec("B", "02"));
        (void)agg.fold(rec("A", "02"));
        (void)agg.fold(rec("B", "02"));
        const Summary s = agg.summary();
        if (s.healthy_devices.size() != 2) return 5;
        if (s.healthy_devices[0] != HealthyDevice{"B", 2}) return 6;
        if (s.healthy_devices[1] != HealthyDevice{"A", 1}) return 7;
    }

    // Case 3: "DD" after "02" moves the sensor out of the healthy map
    {
        DeviceAggregator agg;
        (void)agg.fold(rec("S1", "02"));
        (void)agg.fold(rec("S1", "02"));
        if (agg.fold(rec("S1", "DD", "081", "0000")) != FoldOutcome::kFaultRecorded) return 8;
        const Summary s = agg.summary();
        if (s.healthy_count != 0 || s.faulty_count != 1 || s.total_devices != 1) return 9;
        if (s.faulty_devices[0] != FaultyDevice{"S1", FaultReason::Battery}) return 10;
    }

    // Case 4: faulty is sticky, and the first "DD" fixes the reason
    {
        DeviceAggregator agg;
        (void)agg.fold(rec("S2", "DD", "001", "0800"));   // temperature
        if (agg.fold(rec("S2", "02")) != FoldOutcome::kIgnoredSticky) return 11;
        if (agg.fold(rec("S2", "DD", "081", "0000")) != FoldOutcome::kIgnoredDuplicateFault) return 12;
        const Summary s = agg.summary();
        if (s.healthy_count != 0) return 13;
        if (s.faulty_devices.size() != 1 || s.faulty_devices[0].reason != FaultReason::Temperature) return 14;

        const DeviceState* st = agg.find("S2");
        if (!st || !is_faulty(*st)) return 15;
        if (std::get<Faulty>(*st).reason != FaultReason::Temperature) return 16;
    }

    // Case 5: other states are ignored and do not create a device
    {
        DeviceAggregator agg;
        if (agg.fold(rec("S3", "01")) != FoldOutcome::kIgnoredState) return 17;
        if (agg.fold(rec("S3", "dd")) != FoldOutcome::kIgnoredState) return 18;
        if (agg.fold(rec("S3", "")) != FoldOutcome::kIgnoredState) return 19;
        if (agg.device_count() != 0) return 20;
        if (agg.find("S3") != nullptr) return 21;
        if (agg.summary() != Summary{}) return 22;
    }

    // Case 6: faulty list follows first "DD" order, not first sight order
    {
        DeviceAggregator agg;
        (void)agg.fold(rec("X", "02"));
        (void)agg.fold(rec("Y", "DD"));
        (void)agg.fold(rec("X", "DD", "001", "0008"));
        const Summary s = agg.summary();
        if (s.faulty_devices.size() != 2) return 23;
        if (s.faulty_devices[0].sensor_id != "Y") return 24;
        if (s.faulty_devices[1] != FaultyDevice{"X", FaultReason::Threshold}) return 25;
        // sp1 "12" -> "1" + "03" -> "000103" -> no flag
        if (s.faulty_devices[0].reason != FaultReason::Unknown) return 26;
    }

    // Case 7: mixed stream, totals line up
    {
        const std::vector<Record> stream{
            rec("A", "02"), rec("B", "02"), rec("C", "DD"), rec("A", "02"),
            rec("B", "DD"), rec("D", "02"), rec("B", "02"), rec("C", "02"),
            rec("E", "7F"), rec("D", "02"), rec("D", "02"),
        };
        const Summary s = faultscan::aggregate::aggregate(stream);
        if (s.total_devices != 4) return 27;
        if (s.total_devices != s.healthy_count + s.faulty_count) return 28;
        if (s.healthy_devices.size() != 2) return 29;
        if (s.healthy_devices[0] != HealthyDevice{"A", 2}) return 30;
        if (s.healthy_devices[1] != HealthyDevice{"D", 3}) return 31;
        if (s.faulty_devices[0].sensor_id != "C" || s.faulty_devices[1].sensor_id != "B") return 32;
    }

    // Case 8: reset gives a fresh aggregator
    {
        DeviceAggregator agg;
        (void)agg.fold(rec("A", "DD"));
        agg.reset();
        (void)agg.fold(rec("A", "02"));
        const Summary s = agg.summary();
        if (s.faulty_count != 0 || s.healthy_count != 1) return 33;
    }

    // Case 9: a flagged pair ahead of a malformed one still names the fault
    {
        DeviceAggregator agg;
        (void)agg.fold(rec("M1", "DD", "0812a1", "0"));   // 08|12|a0
        (void)agg.fold(rec("M2", "DD", "001", "08zz"));   // 00|08|zz
        (void)agg.fold(rec("M3", "DD", "00a1", "08"));    // 00|a0|08
        const Summary s = agg.summary();
        if (s.faulty_devices.size() != 3) return 34;
        if (s.faulty_devices[0] != FaultyDevice{"M1", FaultReason::Battery}) return 35;
        if (s.faulty_devices[1] != FaultyDevice{"M2", FaultReason::Temperature}) return 36;
        if (s.faulty_devices[2] != FaultyDevice{"M3", FaultReason::Unknown}) return 37;
    }

    assert(to_string(FoldOutcome::kIgnoredSticky) == "ignored (sticky fault)");
    return 0;
}
