#pragma once
#include "Config.h"
#include "Device.h"
#include <chrono>
#include <string>
#include <vector>

namespace arp_sweep {

// Everything one CLI run reports.
struct ScanReport {
    std::string interface;
    std::string subnet;
    double timeout_seconds = 0;
    std::string arp_scan_version;  // empty when the version probe failed
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
    std::vector<Device> devices;
};

class JSONWriter {
public:
    // Document form {meta, devices, summary}; NDJSON when cfg.ndjson.
    std::string write(const ScanReport& report, const Config& cfg) const;
    static std::string device_object(const Device& d);
};

}
