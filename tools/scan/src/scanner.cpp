#include <vector>
#include <fstream>
#include <iostream>
#include <algorithm>
#include <filesystem>
#include <system_error>

#include "faultscan/version.hpp"
#include "faultscan/core/time.hpp"
#include "faultscan/parse/line_parser.hpp"
#include "faultscan/aggregate/device_aggregator.hpp"
#include "faultscan/tools/scan/scanner.hpp"
#include "faultscan/tools/scan/version.hpp"

#include "io/line_splitter.hpp"
#include "hash/payload_digest.hpp"
#include "log/stderr_logger.hpp"

namespace fs = std::filesystem;

namespace faultscan::tools::scan{
    using log::logf;

    Status scan_stream(std::istream& in, const ScanConfig& cfg, Report& out, LoggerSink* log){
        const t_ns t0 = now_mono_ns();

        out.manifest.scan_version = kVersionStr;
        out.manifest.faultscan_version = faultscan::kVersionStr;
        out.input.path = cfg.input_path.string();
        out.counters = {};

        IngestCounters& c = out.counters;
        hash::PayloadDigest digest;
        io::LineSplitter split(cfg.max_line_bytes);
        aggregate::DeviceAggregator agg(log);

        // reused across lines so its strings keep their capacity
        Record rec;

        auto on_line = [&](std::string_view line, bool oversized){
            ++c.lines_total;

            if (oversized){
                ++c.lines_rejected;
                logf(log, LogLevel::kDebug, "line %llu: rejected (longer than %zu bytes)",
                     static_cast<unsigned long long>(c.lines_total), cfg.max_line_bytes);
                return;
            }

            const parse::LineVerdict v = parse::parse_line(line, rec);
            if (v != parse::LineVerdict::kAccepted){
                ++c.lines_rejected;
                if (log && log->enabled(LogLevel::kDebug)){
                    const std::string_view why = parse::to_string(v);
                    logf(log, LogLevel::kDebug, "line %llu: rejected (%.*s)",
                         static_cast<unsigned long long>(c.lines_total),
                         static_cast<int>(why.size()), why.data());
                }
                return;
            }

            switch (agg.fold(rec)){
                case aggregate::FoldOutcome::kHealthyCounted:
                    ++c.records_healthy;
                    break;
                case aggregate::FoldOutcome::kFaultRecorded:
                    ++c.records_faulty;
                    break;
                case aggregate::FoldOutcome::kIgnoredSticky:
                case aggregate::FoldOutcome::kIgnoredDuplicateFault:
                case aggregate::FoldOutcome::kIgnoredState:
                    ++c.records_ignored;
                    break;
            }
        };

        std::vector<char> buf(std::max<std::size_t>(cfg.read_buffer_bytes, 1));
        while (in){
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            const std::streamsize n = in.gcount();
            if (n <= 0) break;

            digest.update(buf.data(), static_cast<std::size_t>(n));
            split.feed(std::string_view(buf.data(), static_cast<std::size_t>(n)), on_line);
        }

        // eof/fail after a short read is the normal end; bad is a real read error
        if (in.bad()) return Status::kIoError;

        split.finish(on_line);

        out.summary = agg.summary();
        out.input.size_bytes = digest.bytes();
        out.input.payload_blake3 = digest.hex();
        out.elapsed_ns = now_mono_ns() - t0;

        logf(log, LogLevel::kInfo,
             "scanned %llu lines (%llu rejected): %llu devices, %llu healthy, %llu faulty",
             static_cast<unsigned long long>(c.lines_total),
             static_cast<unsigned long long>(c.lines_rejected),
             static_cast<unsigned long long>(out.summary.total_devices),
             static_cast<unsigned long long>(out.summary.healthy_count),
             static_cast<unsigned long long>(out.summary.faulty_count));
        return Status::kOK;
    }

    Expected<Report> run_scan(const ScanConfig& cfg, LoggerSink* log){
        Report report{};

        if (reads_stdin(cfg)){
            const Status st = scan_stream(std::cin, cfg, report, log);
            if (st != Status::kOK){
                logf(log, LogLevel::kError, "Error: Unable to read standard input.");
                return Expected<Report>::failure(st);
            }
            return Expected<Report>::success(std::move(report));
        }

        const std::string path = cfg.input_path.string();
        if (path.empty()) return Expected<Report>::failure(Status::kInvalidArg);

        std::error_code ec;
        const auto type = fs::status(cfg.input_path, ec).type();
        if (type == fs::file_type::not_found){
            logf(log, LogLevel::kError, "Error: File '%s' not found.", path.c_str());
            return Expected<Report>::failure(Status::kNotFound);
        }
        if (ec || type == fs::file_type::directory){
            logf(log, LogLevel::kError, "Error: Unable to read file '%s'. Reason: %s",
                 path.c_str(), ec ? ec.message().c_str() : "is a directory");
            return Expected<Report>::failure(Status::kIoError);
        }

        std::ifstream in(cfg.input_path, std::ios::binary);
        if (!in){
            logf(log, LogLevel::kError, "Error: Unable to read file '%s'. Reason: open failed", path.c_str());
            return Expected<Report>::failure(Status::kIoError);
        }

        const Status st = scan_stream(in, cfg, report, log);
        if (st != Status::kOK){
            logf(log, LogLevel::kError, "Error: Unable to read file '%s'. Reason: %s",
                 path.c_str(), to_string(st));
            return Expected<Report>::failure(st);
        }
        return Expected<Report>::success(std::move(report));
    }

} // namespace faultscan::tools::scan
