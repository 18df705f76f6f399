#pragma once

#include <string>
#include <vector>

#include "faultscan/core/time.hpp"
#include "faultscan/core/summary.hpp"

namespace faultscan::tools::scan::report{
    /// @brief healthy devices by descending count; equal counts keep first-appearance order
    [[nodiscard]] std::vector<HealthyDevice> sorted_healthy(const Summary& s);

    /// @brief human readable report: counts, faulty sensors with reasons, healthy sensors by count
    [[nodiscard]] std::string render_text(const Summary& s);

    /// @brief "Scan took <seconds> seconds."
    [[nodiscard]] std::string render_timing(t_ns elapsed_ns);

} // namespace faultscan::tools::scan::report
