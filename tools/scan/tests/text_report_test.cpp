#include <string>

#include "faultscan/core/summary.hpp"
#include "report/text_report.hpp"

using namespace faultscan;
using namespace faultscan::tools::scan;

int main(){
    Summary s;
    s.faulty_devices = {
        {"CD", FaultReason::Temperature},
        {"AA", FaultReason::Unknown},
    };
    s.healthy_devices = {
        {"X1", 2}, {"X2", 5}, {"X3", 2}, {"X4", 7}, {"X5", 5},
    };
    s.healthy_count = 5;
    s.faulty_count = 2;
    s.total_devices = 7;

    // Case 1: descending by count, ties in first-appearance order
    {
        const auto v = report::sorted_healthy(s);
        const char* want[] = {"X4", "X2", "X5", "X1", "X3"};
        for (std::size_t i = 0; i < v.size(); ++i){
            if (v[i].sensor_id != want[i]) return 1;
        }
        // the summary itself is untouched
        if (s.healthy_devices[0].sensor_id != "X1") return 2;
    }

    // Case 2: full text layout
    {
        const std::string want =
            "All big messages: 7\n\n"
            "Successful big messages: 5\n\n"
            "Failed big messages: 2\n\n"
            "CD: Temperature device error\n"
            "AA: Unknown device error\n"
            "\nSuccess messages count:\n"
            "X4: 7\n"
            "X2: 5\n"
            "X5: 5\n"
            "X1: 2\n"
            "X3: 2\n";
        if (report::render_text(s) != want) return 3;
    }

    // Case 3: empty summary still prints every heading
    {
        const std::string want =
            "All big messages: 0\n\n"
            "Successful big messages: 0\n\n"
            "Failed big messages: 0\n\n"
            "\nSuccess messages count:\n";
        if (report::render_text(Summary{}) != want) return 4;
    }

    // Case 4: timing line
    if (report::render_timing(1'500'000'000) != "Scan took 1.500000 seconds.\n") return 5;

    return 0;
}
