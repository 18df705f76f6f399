#pragma once

#include <cstddef>      // byte limits
#include <optional>     // outputs that may be off
#include <filesystem>

#include "faultscan/io/logger.hpp"

namespace faultscan::tools::scan{
    // input path meaning "read standard input"
    inline constexpr char kStdinPath[] = "-";

    /// @brief settings for one scan run, filled from the command line
    struct ScanConfig{
        // // Inputs
        // telemetry log to scan, "-" for stdin
        std::filesystem::path input_path;

        // // Outputs
        // deterministic JSON report (off when absent)
        std::optional<std::filesystem::path> json_out;

        // text report on stdout
        bool print_text{true};

        // "Scan took N seconds." after the report
        bool show_timing{false};

        // stderr threshold
        LogLevel log_level{LogLevel::kWarn};

        // // Limits
        // longer lines are counted as rejected without being parsed (1 MiB)
        std::size_t max_line_bytes{1u << 20};

        // chunk size for reading and hashing the input (64 KiB)
        std::size_t read_buffer_bytes{64u * 1024u};
    };

    [[nodiscard]] inline bool reads_stdin(const ScanConfig& cfg){
        return cfg.input_path == kStdinPath;
    }

} // namespace faultscan::tools::scan
