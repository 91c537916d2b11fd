#pragma once
#include <string>

namespace arp_sweep {

// Upper bound for timeout and watchdog grace, in seconds. Keeps the
// watchdog deadline representable as steady_clock nanoseconds.
inline constexpr double kMaxTimeoutSeconds = 86400;

struct Config {
    std::string interface;             // -I for arp-scan, required for a scan
    std::string subnet;                // passed through uninterpreted (CIDR or plain address)
    double timeout_seconds = 5;        // per-host probe timeout handed to arp-scan (-t, in ms)
    double watchdog_grace_seconds = 10; // added to timeout_seconds for the wall-clock watchdog
    std::string arp_scan_binary = "arp-scan";
    std::string output_file;           // empty = stdout
    bool pretty = false;
    bool compact = false;              // wins over pretty
    bool ndjson = false;               // one device object per line
    std::string log_level = "info";
    bool log_json = false;
    bool check_only = false;           // --check: report availability and exit
    bool tool_version_only = false;    // --tool-version: print arp-scan --version and exit
};

Config& config();
void set_config(const Config& c);

}
