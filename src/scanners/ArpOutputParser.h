#pragma once
#include "../core/Device.h"
#include <string>
#include <vector>

namespace arp_sweep {

class Logger;

// Candidate record before validation; `line` is kept for diagnostics.
struct RawDevice {
    Device device;
    std::string line;
};

class ArpOutputParser {
public:
    // Splits `--format '${ip}\t${mac}\t${vendor}' --plain` output into candidates.
    // Lines with fewer than two tab-separated fields are skipped with a warning.
    static std::vector<RawDevice> parse_lines(const std::string& output, Logger& log);

    // parse_lines followed by validation; rejected candidates are logged and dropped.
    static std::vector<Device> parse(const std::string& output, Logger& log);

    static bool is_valid_ip(const std::string& ip);
    static bool is_valid_mac(const std::string& mac);

    static std::string trim(const std::string& s);
};

}
