#include "scanners/ArpOutputParser.h"
#include "core/Logging.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace {
// Silent sink so fuzzing throughput is not dominated by stderr writes.
class NullLogger : public arp_sweep::Logger {
protected:
    void write_line(arp_sweep::LogLevel, const std::string&) override {}
};
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);
    static NullLogger log;
    log.set_level(arp_sweep::LogLevel::Trace);

    auto devices = arp_sweep::ArpOutputParser::parse(input, log);
    for (const auto& d : devices) {
        // Every accepted record must satisfy both validators.
        if (!arp_sweep::ArpOutputParser::is_valid_ip(d.ip) || !arp_sweep::ArpOutputParser::is_valid_mac(d.mac)) __builtin_trap();
    }
    return 0;
}
