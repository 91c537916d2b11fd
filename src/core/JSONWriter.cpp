#include "JSONWriter.h"
#include "JsonUtil.h"
#include "BuildInfo.h"
#include <sstream>
#include <iomanip>

namespace arp_sweep {
namespace {

    using jsonutil::escape; using jsonutil::time_to_iso; using jsonutil::time_to_iso_ms;

    static std::string format_number(double v) {
        std::ostringstream os; os << std::setprecision(15) << v; return os.str();
    }

    static long long duration_ms(const ScanReport& r) {
        if (r.started_at.time_since_epoch().count() && r.finished_at.time_since_epoch().count() &&
            r.finished_at >= r.started_at) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(r.finished_at - r.started_at).count();
        }
        return 0;
    }

    static std::string meta_fields(const ScanReport& r) {
        std::ostringstream os;
        os << "\"tool\":\"arp-sweep\",\"tool_version\":\"" << escape(buildinfo::APP_VERSION) << "\"";
        if (!r.arp_scan_version.empty()) os << ",\"arp_scan_version\":\"" << escape(r.arp_scan_version) << "\"";
        os << ",\"interface\":\"" << escape(r.interface) << "\""
           << ",\"subnet\":\"" << escape(r.subnet) << "\""
           << ",\"timeout_seconds\":" << format_number(r.timeout_seconds)
           << ",\"started_at\":\"" << time_to_iso(r.started_at) << "\""
           << ",\"finished_at\":\"" << time_to_iso(r.finished_at) << "\"";
        return os.str();
    }

    static std::string generate_ndjson_output(const ScanReport& r) {
        std::ostringstream nd;
        nd << '{' << "\"type\":\"meta\"," << meta_fields(r) << '}' << "\n";
        nd << '{' << "\"type\":\"summary\",\"device_count\":" << r.devices.size()
           << ",\"duration_ms\":" << duration_ms(r) << '}' << "\n";
        for (const auto& d : r.devices) {
            std::string obj = JSONWriter::device_object(d);
            nd << "{\"type\":\"device\"," << obj.substr(1) << "\n";
        }
        return nd.str();
    }

    static std::string pretty_print_json(const std::string& compact_json) {
        std::string out;
        out.reserve(compact_json.size() * 2);
        int depth = 0;
        bool in_string = false;
        bool esc = false;

        auto indent = [&](int d) {
            for (int i = 0; i < d; i++) out.append("  ");
        };

        for (size_t i = 0; i < compact_json.size(); ++i) {
            char c = compact_json[i];
            out.push_back(c);

            if (esc) { esc = false; continue; }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { in_string = !in_string; continue; }
            if (in_string) continue;

            switch (c) {
                case '{':
                case '[':
                    out.push_back('\n');
                    depth++;
                    indent(depth);
                    break;
                case '}':
                case ']':
                    // closing char already pushed; move it onto its own line
                    out.pop_back();
                    out.push_back('\n');
                    depth--;
                    if (depth < 0) depth = 0;
                    indent(depth);
                    out.push_back(c);
                    break;
                case ',':
                    out.push_back('\n');
                    indent(depth);
                    break;
                case ':':
                    out.push_back(' ');
                    break;
                default:
                    break;
            }
        }
        out.push_back('\n');
        return out;
    }
}

std::string JSONWriter::device_object(const Device& d) {
    std::ostringstream os;
    os << "{\"ip\":\"" << escape(d.ip) << "\",\"mac\":\"" << escape(d.mac)
       << "\",\"vendor\":\"" << escape(d.vendor) << "\",\"detected_at\":\"" << time_to_iso_ms(d.detected_at) << "\"}";
    return os.str();
}

std::string JSONWriter::write(const ScanReport& report, const Config& cfg) const {
    if (cfg.ndjson) return generate_ndjson_output(report);

    std::ostringstream os;
    os << "{\"meta\":{" << meta_fields(report) << "},\"devices\":[";
    for (size_t i = 0; i < report.devices.size(); ++i) {
        if (i) os << ',';
        os << device_object(report.devices[i]);
    }
    os << "],\"summary\":{\"device_count\":" << report.devices.size()
       << ",\"duration_ms\":" << duration_ms(report) << "}}";
    std::string compact = os.str();

    if (cfg.pretty && !cfg.compact) {
        return pretty_print_json(compact);
    }
    return compact;
}

}
