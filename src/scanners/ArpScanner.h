#pragma once
#include "../core/Device.h"
#include "../core/Logging.h"
#include "../core/Process.h"
#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <vector>

namespace arp_sweep {

struct ArpScannerOptions {
    std::string binary = "arp-scan";
    // Added to the tool timeout to form the wall-clock watchdog. arp-scan's -t
    // bounds each host probe, not the whole run.
    std::chrono::milliseconds watchdog_grace{10000};
    std::chrono::milliseconds kill_grace{2000};
};

// Discovers hosts by running arp-scan on one interface/subnet. One scan at a
// time per instance: a concurrent call fails with ReentrancyError.
class ArpScanner {
public:
    explicit ArpScanner(Logger& log = Logger::instance(),
                        ProcessRunner& runner = default_process_runner(),
                        ArpScannerOptions opts = {});

    std::vector<Device> scan(const std::string& iface, const std::string& subnet, double timeout_seconds = 5);

    // Reentrancy is checked on the calling thread; the returned future carries
    // every other outcome. The scanner must outlive the returned future.
    std::future<std::vector<Device>> scan_async(std::string iface, std::string subnet, double timeout_seconds = 5);

    bool in_progress() const { return running_.load(); }

    std::vector<std::string> build_args(const std::string& iface, const std::string& subnet, double timeout_seconds) const;
    std::chrono::milliseconds watchdog_deadline(double timeout_seconds) const;

    // `which <binary>`; any failure is reported as false.
    static bool check_availability(ProcessRunner& runner = default_process_runner(), const std::string& binary = "arp-scan",
                                   Logger& log = Logger::instance());

    // `<binary> --version`, combined output trimmed. Throws VersionError.
    static std::string get_version(ProcessRunner& runner = default_process_runner(), const std::string& binary = "arp-scan",
                                   Logger& log = Logger::instance());

private:
    std::vector<Device> run_scan(const std::string& iface, const std::string& subnet, double timeout_seconds);
    std::vector<Device> execute_scan(const std::string& iface, const std::string& subnet, double timeout_seconds);
    static void validate_inputs(const std::string& iface, double timeout_seconds);

    Logger& log_;
    ProcessRunner& runner_;
    ArpScannerOptions opts_;
    std::atomic<bool> running_{false};
};

}
