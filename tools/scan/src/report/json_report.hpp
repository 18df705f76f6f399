#pragma once

#include <string>
#include <filesystem>

#include "faultscan/core/status.hpp"
#include "faultscan/tools/scan/report.hpp"

namespace faultscan::tools::scan::report{
    // bump when the document layout changes
    inline constexpr char kSchemaId[] = "faultscan.report.v1";

    /// @brief deterministic JSON document for a Report (elapsed time excluded so reruns compare equal)
    [[nodiscard]] std::string render_json(const Report& r);

    /// @brief write render_json(r) plus a trailing newline to path
    /// @return kOK or kIoError
    [[nodiscard]] Status write_json(const std::filesystem::path& path, const Report& r);

} // namespace faultscan::tools::scan::report
