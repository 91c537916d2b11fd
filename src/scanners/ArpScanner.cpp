#include "ArpScanner.h"
#include "ArpOutputParser.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../core/ScanGuard.h"
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace arp_sweep {

static const char* kToolName = "arp-scan";
static const char* kOutputFormat = "${ip}\t${mac}\t${vendor}";

ArpScanner::ArpScanner(Logger& log, ProcessRunner& runner, ArpScannerOptions opts)
    : log_(log), runner_(runner), opts_(std::move(opts)) {}

std::vector<Device> ArpScanner::scan(const std::string& iface, const std::string& subnet, double timeout_seconds){
    ScanGuard guard(running_);
    return run_scan(iface, subnet, timeout_seconds);
}

std::future<std::vector<Device>> ArpScanner::scan_async(std::string iface, std::string subnet, double timeout_seconds){
    ScanGuard guard(running_);
    return std::async(std::launch::async,
        [this, g = std::move(guard), iface = std::move(iface), subnet = std::move(subnet), timeout_seconds]() mutable {
            ScanGuard held = std::move(g);
            return run_scan(iface, subnet, timeout_seconds);
        });
}

void ArpScanner::validate_inputs(const std::string& iface, double timeout_seconds){
    if(iface.empty()) throw std::invalid_argument("interface must not be empty");
    if(!std::isfinite(timeout_seconds) || timeout_seconds <= 0) throw std::invalid_argument("timeout must be a positive number of seconds");
    if(timeout_seconds > kMaxTimeoutSeconds) throw std::invalid_argument("timeout must not exceed " + std::to_string(static_cast<long>(kMaxTimeoutSeconds)) + " seconds");
}

std::vector<Device> ArpScanner::run_scan(const std::string& iface, const std::string& subnet, double timeout_seconds){
    validate_inputs(iface, timeout_seconds);
    log_.info("Starting ARP scan on " + iface + " for subnet " + subnet);
    try {
        auto devices = execute_scan(iface, subnet, timeout_seconds);
        log_.info("ARP scan completed. Found " + std::to_string(devices.size()) + " devices");
        return devices;
    } catch(const std::exception& ex){
        log_.error(std::string("ARP scan failed: ") + ex.what());
        throw;
    }
}

std::vector<std::string> ArpScanner::build_args(const std::string& iface, const std::string& subnet, double timeout_seconds) const {
    long long timeout_ms = std::llround(timeout_seconds * 1000.0);
    return {
        opts_.binary,
        "-I", iface,
        "-t", std::to_string(timeout_ms),
        "--format", kOutputFormat,
        "--plain",
        "--quiet",
        subnet
    };
}

std::chrono::milliseconds ArpScanner::watchdog_deadline(double timeout_seconds) const {
    return std::chrono::milliseconds(std::llround(timeout_seconds * 1000.0)) + opts_.watchdog_grace;
}

std::vector<Device> ArpScanner::execute_scan(const std::string& iface, const std::string& subnet, double timeout_seconds){
    auto args = build_args(iface, subnet, timeout_seconds);
    log_.debug("Executing: " + join_argv(args));

    ProcessOptions po;
    po.deadline = watchdog_deadline(timeout_seconds);
    po.kill_grace = opts_.kill_grace;

    ProcessResult res;
    try {
        res = runner_.run(args, po);
    } catch(const SpawnError& ex){
        log_.error(std::string("Failed to start arp-scan process: ") + ex.what());
        throw SpawnError(std::string("Failed to execute arp-scan: ") + std::strerror(ex.error_code()), ex.error_code());
    } catch(const TimeoutError&){
        log_.warn("arp-scan exceeded " + std::to_string(po.deadline->count()) + "ms, terminated");
        throw TimeoutError();
    }

    if(res.exit_code != 0){
        log_.error(std::string(kToolName) + " exited with code " + std::to_string(res.exit_code) + ": " + res.err);
        throw ExitError(kToolName, res.exit_code, res.err);
    }

    try {
        return ArpOutputParser::parse(res.out, log_);
    } catch(const std::exception& ex){
        throw ParseError(std::string("Failed to parse arp-scan output: ") + ex.what());
    }
}

bool ArpScanner::check_availability(ProcessRunner& runner, const std::string& binary, Logger& log){
    try {
        return runner.run({"which", binary}, ProcessOptions{}).exit_code == 0;
    } catch(const std::exception& ex){
        log.debug(std::string("availability probe failed: ") + ex.what());
        return false;
    }
}

std::string ArpScanner::get_version(ProcessRunner& runner, const std::string& binary, Logger& log){
    ProcessResult res;
    try {
        res = runner.run({binary, "--version"}, ProcessOptions{});
    } catch(const ScanError& ex){
        log.debug(std::string("version probe failed: ") + ex.what());
        throw VersionError();
    }
    if(res.exit_code != 0){
        log.debug("version probe exited with code " + std::to_string(res.exit_code));
        throw VersionError();
    }
    return ArpOutputParser::trim(res.combined);
}

}
