#include <chrono> // to measure time
#include <vector>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <algorithm>

#include "faultscan/all.hpp"

using namespace faultscan;

// // Per line latency percentiles + min/max
struct Stats {
    /*
    p50 = median, p95/p99 = tail
    jmin/jmax = fastest/slowest line
    */
    double p50, p95, p99, jmin, jmax;
};

static Stats summarize(std::vector<double>& ns){
    std::sort(ns.begin(), ns.end());
    const std::size_t n = ns.size();

    auto q = [&](double p) -> double {
        const double pos = p * static_cast<double>(n - 1u);
        return ns[static_cast<std::size_t>(pos)];
    };

    return {q(0.50), q(0.95), q(0.99), ns.front(), ns.back()};
}

// // synthetic log: n_sensors ids, every 7th line "DD", every 11th line noise
static std::vector<std::string> make_log(std::size_t lines, std::size_t n_sensors){
    std::vector<std::string> out;
    out.reserve(lines);
    char buf[256];
    for (std::size_t i = 0; i < lines; ++i){
        if (i % 11 == 10){
            out.emplace_back("2024-05-02 10:14:07 heartbeat ok");
            continue;
        }
        const char* state = (i % 7 == 6) ? "DD" : "02";
        std::snprintf(buf, sizeof(buf),
            "2024-05-02 10:14:07 rx > 'BIG;1;dev%zu;0;0;0;%02zu31;0;0;0;0;0;0;0;0;-%04zu;0;%s;0'",
            i % n_sensors, i % 100, (i * 37) % 10000, state);
        out.emplace_back(buf);
    }
    return out;
}

int main(int argc, char** argv){
    // Defaults
    std::size_t lines = 200000;
    std::size_t sensors = 5000;
    int rounds = 20;
    bool opt_no_header = false;

    if (argc > 1) lines = static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10));
    if (argc > 2) sensors = static_cast<std::size_t>(std::strtoull(argv[2], nullptr, 10));
    if (argc > 3) rounds = std::atoi(argv[3]);
    for (int i = 4; i < argc; ++i){
        if (std::strcmp(argv[i], "--no-header") == 0) opt_no_header = true;
    }
    if (lines == 0 || sensors == 0 || rounds <= 0) return 2;

    const auto log = make_log(lines, sensors);

    using clk = std::chrono::steady_clock;
    std::vector<double> per_line_ns;
    per_line_ns.reserve(static_cast<std::size_t>(rounds));

    std::uint64_t checksum = 0;
    for (int r = 0; r < rounds; ++r){
        aggregate::DeviceAggregator agg;
        Record rec;

        const auto t0 = clk::now();
        for (const auto& l : log){
            if (parse::parse_line(l, rec) == parse::LineVerdict::kAccepted) (void)agg.fold(rec);
        }
        const Summary s = agg.summary();
        const auto t1 = clk::now();

        // keep the work observable
        checksum += s.total_devices + s.faulty_count;
        per_line_ns.push_back(std::chrono::duration<double, std::nano>(t1 - t0).count() / static_cast<double>(lines));
    }

    const Stats S = summarize(per_line_ns);

    if (!opt_no_header){
        std::puts("label, lines, sensors, rounds, p50_ns_per_line, p95, p99, jmin, jmax, lines_per_sec_p50, checksum");
    }
    std::printf("scan, %zu, %zu, %d, %.3f, %.3f, %.3f, %.3f, %.3f, %.0f, %llu\n",
                lines, sensors, rounds, S.p50, S.p95, S.p99, S.jmin, S.jmax,
                S.p50 > 0.0 ? 1e9 / S.p50 : 0.0,
                static_cast<unsigned long long>(checksum));
    return 0;
}
