#include <cstdio>
#include <algorithm>

#include "report/text_report.hpp"

namespace faultscan::tools::scan::report{
    std::vector<HealthyDevice> sorted_healthy(const Summary& s){
        std::vector<HealthyDevice> v = s.healthy_devices;
        std::stable_sort(v.begin(), v.end(), [](const HealthyDevice& a, const HealthyDevice& b){
            return a.count > b.count;
        });
        return v;
    }

    std::string render_text(const Summary& s){
        std::string out;
        out.reserve(128 + 48 * (s.faulty_devices.size() + s.healthy_devices.size()));

        out += "All big messages: " + std::to_string(s.total_devices) + "\n\n";
        out += "Successful big messages: " + std::to_string(s.healthy_count) + "\n\n";
        out += "Failed big messages: " + std::to_string(s.faulty_count) + "\n\n";

        for (const auto& f : s.faulty_devices){
            out += f.sensor_id;
            out += ": ";
            out += to_string(f.reason);
            out += '\n';
        }

        out += "\nSuccess messages count:\n";
        for (const auto& h : sorted_healthy(s)){
            out += h.sensor_id + ": " + std::to_string(h.count) + "\n";
        }
        return out;
    }

    std::string render_timing(t_ns elapsed_ns){
        char buf[64];
        std::snprintf(buf, sizeof(buf), "Scan took %.6f seconds.\n", static_cast<double>(elapsed_ns) * 1e-9);
        return buf;
    }
} // namespace faultscan::tools::scan::report
