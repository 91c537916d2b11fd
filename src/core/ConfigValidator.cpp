#include "ConfigValidator.h"
#include "Logging.h"
#include <cmath>
#include <iostream>

namespace arp_sweep {

bool ConfigValidator::validate(Config& cfg) {
    // pretty vs compact: if both set, compact wins (documented behavior)
    if(cfg.pretty && cfg.compact) {
        cfg.pretty = false;
    }

    if(cfg.ndjson && cfg.pretty) {
        std::cerr << "--ndjson and --pretty are mutually exclusive\n";
        return false;
    }

    LogLevel lvl;
    if(!parse_log_level(cfg.log_level, lvl)) {
        std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
        return false;
    }

    if(cfg.arp_scan_binary.empty()) {
        std::cerr << "--arp-scan requires a non-empty path\n";
        return false;
    }

    // Probe modes need nothing else
    if(cfg.check_only || cfg.tool_version_only) return true;

    if(cfg.interface.empty()) {
        std::cerr << "--interface is required\n";
        return false;
    }
    if(cfg.subnet.empty()) {
        std::cerr << "--subnet is required\n";
        return false;
    }
    if(!validate_positive(cfg.timeout_seconds, "--timeout")) return false;
    if(!validate_positive(cfg.watchdog_grace_seconds, "--watchdog-grace")) return false;

    return true;
}

bool ConfigValidator::validate_positive(double value, const std::string& flag_name) {
    if(!std::isfinite(value) || value <= 0) {
        std::cerr << "Invalid " << flag_name << " value: must be a positive number of seconds\n";
        return false;
    }
    if(value > kMaxTimeoutSeconds) {
        std::cerr << "Invalid " << flag_name << " value: must not exceed " << kMaxTimeoutSeconds << " seconds\n";
        return false;
    }
    return true;
}

}
