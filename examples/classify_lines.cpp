#include <cstdio>
#include <string>
#include <vector>

#include "faultscan/all.hpp"

using namespace faultscan;

/*
1. Parse each raw line (rejects are skipped)
2. Fold accepted records into the aggregator
3. Print every sensor's final state
*/
int main(){
    const std::vector<std::string> lines{
        "2024-05-02 10:14:07 rx > 'BIG;1;ab;0;0;0;12;0;0;0;0;0;0;0;0;03;0;02;0'",
        "2024-05-02 10:14:08 rx > 'BIG;1;cd;0;0;0;99;0;0;0;0;0;0;0;0;-50;0;DD;0'",
        "2024-05-02 10:14:09 rx > 'BIG;1;ab;0;0;0;12;0;0;0;0;0;0;0;0;03;0;02;0'",
        "2024-05-02 10:14:10 rx > 'BIG;1;cd;0;0;0;12;0;0;0;0;0;0;0;0;03;0;02;0'",
        "2024-05-02 10:14:11 heartbeat",
    };

    aggregate::DeviceAggregator agg;
    for (const auto& l : lines){
        const auto r = parse::parse_line(l);
        if (!r) continue;
        (void)agg.fold(*r);
    }

    const Summary s = agg.summary();
    std::printf("devices=%llu healthy=%llu faulty=%llu\n",
                static_cast<unsigned long long>(s.total_devices),
                static_cast<unsigned long long>(s.healthy_count),
                static_cast<unsigned long long>(s.faulty_count));

    for (const auto& f : s.faulty_devices){
        const std::string reason(to_string(f.reason));
        std::printf("  %s: %s\n", f.sensor_id.c_str(), reason.c_str());
    }
    for (const auto& h : s.healthy_devices){
        std::printf("  %s: ok x%llu\n", h.sensor_id.c_str(), static_cast<unsigned long long>(h.count));
    }
    return 0;
}
