#include <cstdio>
#include <string>
#include <cstdlib>
#include <cstring>
#include <charconv>
#include <string_view>

#include "faultscan/version.hpp"
#include "faultscan/tools/scan/report.hpp"
#include "faultscan/tools/scan/scanner.hpp"
#include "faultscan/tools/scan/version.hpp"
#include "faultscan/tools/scan/exit_codes.hpp"
#include "faultscan/tools/scan/scan_config.hpp"

#include "log/stderr_logger.hpp"
#include "report/text_report.hpp"
#include "report/json_report.hpp"

using namespace faultscan;
using namespace faultscan::tools::scan;

static void usage(){
    std::fprintf(
        stderr,
        "faultscan --input <file|-> [--json <file>] [--quiet] [--timing] "
        "[--log-level {trace|debug|info|warn|error}] [--max-line-bytes N]\n"
        "  --input           telemetry log, '-' reads stdin\n"
        "  --json            also write a JSON report\n"
        "  --quiet           no text report on stdout\n"
        "  --timing          print how long the scan took\n"
        "  --log-level       stderr threshold (default warn)\n"
        "  --max-line-bytes  longer lines count as rejected (default 1048576)\n"
        "  --version         print version and exit\n"
    );
}

// positive integer or nothing
static bool parse_size(const char* s, std::size_t& out){
    const std::string_view v(s);
    std::size_t n = 0;
    const auto r = std::from_chars(v.data(), v.data() + v.size(), n);
    if (r.ec != std::errc{} || r.ptr != v.data() + v.size() || n == 0) return false;
    out = n;
    return true;
}

int main(int argc, char** argv){
    ScanConfig cfg;
    bool have_input = false;

    for (int i=1; i<argc; i++){
        if (!std::strcmp(argv[i], "--input") && i+1<argc){
            cfg.input_path = argv[++i];
            have_input = true;
        }
        else if (!std::strcmp(argv[i], "--json") && i+1<argc) cfg.json_out = argv[++i];
        else if (!std::strcmp(argv[i], "--quiet")) cfg.print_text = false;
        else if (!std::strcmp(argv[i], "--timing")) cfg.show_timing = true;
        else if (!std::strcmp(argv[i], "--log-level") && i+1<argc){
            const auto lvl = log::parse_log_level(argv[++i]);
            if (!lvl){
                std::fprintf(stderr, "faultscan: unknown log level '%s'\n", argv[i]);
                usage();
                return to_int(ExitCode::kBadArgs);
            }
            cfg.log_level = *lvl;
        }
        else if (!std::strcmp(argv[i], "--max-line-bytes") && i+1<argc){
            if (!parse_size(argv[++i], cfg.max_line_bytes)){
                std::fprintf(stderr, "faultscan: invalid --max-line-bytes '%s'\n", argv[i]);
                usage();
                return to_int(ExitCode::kBadArgs);
            }
        }
        else if (!std::strcmp(argv[i], "--version")){
            std::printf("faultscan %s (library %s)\n", tools::scan::kVersionStr, faultscan_version_string());
            return to_int(ExitCode::kOk);
        }
        else if (!std::strcmp(argv[i], "--help") || !std::strcmp(argv[i], "-h")){
            usage();
            return to_int(ExitCode::kOk);
        }
        else{
            usage();
            return to_int(ExitCode::kBadArgs);
        }
    }

    if (!have_input){
        std::fprintf(stderr, "faultscan: --input is required\n");
        usage();
        return to_int(ExitCode::kBadArgs);
    }

    log::StderrLogger logger(cfg.log_level);

    auto result = run_scan(cfg, &logger);
    if (!result) return to_int(from_scan_status(result.status()));

    const Report rep = result.take();

    if (cfg.print_text){
        const std::string text = report::render_text(rep.summary);
        std::fwrite(text.data(), 1, text.size(), stdout);
    }

    if (cfg.show_timing){
        const std::string t = report::render_timing(rep.elapsed_ns);
        std::fwrite(t.data(), 1, t.size(), stdout);
    }

    if (cfg.json_out){
        const Status st = report::write_json(*cfg.json_out, rep);
        if (st != Status::kOK){
            log::logf(&logger, LogLevel::kError, "Error: Unable to write report '%s'. Reason: %s",
                      cfg.json_out->string().c_str(), to_string(st));
            return to_int(ExitCode::kWriteFail);
        }
    }

    std::fflush(stdout);
    return to_int(ExitCode::kOk);
}
