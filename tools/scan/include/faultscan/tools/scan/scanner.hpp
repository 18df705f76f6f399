#pragma once

#include <istream>

#include "faultscan/core/status.hpp"
#include "faultscan/core/expected.hpp"
#include "faultscan/io/logger.hpp"
#include "faultscan/tools/scan/report.hpp"
#include "faultscan/tools/scan/scan_config.hpp"

namespace faultscan::tools::scan{
    /// @brief run the parse -> fold pipeline over an already open stream
    /// @param in line source; read in cfg.read_buffer_bytes chunks
    /// @param cfg limits (input_path is only copied into the report)
    /// @param out filled with counters, summary, size and digest
    /// @param log optional sink (null = silent)
    /// @return kOK, or kIoError if the stream went bad while reading
    [[nodiscard]] Status scan_stream(std::istream& in, const ScanConfig& cfg, Report& out, LoggerSink* log = nullptr);

    /// @brief open cfg.input_path (or stdin) and scan it
    /// @return Report, kNotFound when the file does not exist, kIoError when it cannot be read
    [[nodiscard]] Expected<Report> run_scan(const ScanConfig& cfg, LoggerSink* log = nullptr);

} // namespace faultscan::tools::scan
