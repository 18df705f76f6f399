#include <fstream>

#include "json/json_deterministic.hpp"
#include "report/json_report.hpp"
#include "report/text_report.hpp"

namespace faultscan::tools::scan::report{
    std::string render_json(const Report& r){
        using namespace jsond;
        std::string out;
        out.reserve(512 + 64 * (r.summary.faulty_devices.size() + r.summary.healthy_devices.size()));

        object(out, [&]{
            key(out, "schema");     str(out, kSchemaId);                        comma(out);

            key(out, "manifest");
            object(out, [&]{
                key(out, "scan_version");      str(out, r.manifest.scan_version);      comma(out);
                key(out, "faultscan_version"); str(out, r.manifest.faultscan_version);
            });
            comma(out);

            key(out, "input");
            object(out, [&]{
                key(out, "path");       str(out, r.input.path);                 comma(out);
                key(out, "size_bytes"); unum(out, r.input.size_bytes);          comma(out);
                key(out, "payload_blake3");
                if (r.input.payload_blake3) str(out, *r.input.payload_blake3);
                else null(out);
            });
            comma(out);

            key(out, "counters");
            object(out, [&]{
                const auto& c = r.counters;
                key(out, "lines_total");     unum(out, c.lines_total);      comma(out);
                key(out, "lines_rejected");  unum(out, c.lines_rejected);   comma(out);
                key(out, "records_healthy"); unum(out, c.records_healthy);  comma(out);
                key(out, "records_faulty");  unum(out, c.records_faulty);   comma(out);
                key(out, "records_ignored"); unum(out, c.records_ignored);
            });
            comma(out);

            key(out, "summary");
            object(out, [&]{
                const auto& s = r.summary;
                key(out, "total_devices"); unum(out, s.total_devices); comma(out);
                key(out, "healthy_count"); unum(out, s.healthy_count); comma(out);
                key(out, "faulty_count");  unum(out, s.faulty_count);  comma(out);

                key(out, "faulty_devices");
                array(out, [&]{
                    bool first = true;
                    for (const auto& f : s.faulty_devices){
                        if (!first) comma(out);
                        first = false;
                        object(out, [&]{
                            key(out, "sensor_id"); str(out, f.sensor_id); comma(out);
                            key(out, "reason");    str(out, to_string(f.reason));
                        });
                    }
                });
                comma(out);

                // same order as the text report
                key(out, "healthy_devices");
                array(out, [&]{
                    bool first = true;
                    for (const auto& h : sorted_healthy(s)){
                        if (!first) comma(out);
                        first = false;
                        object(out, [&]{
                            key(out, "sensor_id"); str(out, h.sensor_id); comma(out);
                            key(out, "count");     unum(out, h.count);
                        });
                    }
                });
            });
        });
        return out;
    }

    Status write_json(const std::filesystem::path& path, const Report& r){
        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        if (!f) return Status::kIoError;

        const std::string doc = render_json(r);
        f.write(doc.data(), static_cast<std::streamsize>(doc.size()));
        f.put('\n');
        f.flush();
        return f ? Status::kOK : Status::kIoError;
    }
} // namespace faultscan::tools::scan::report
