#pragma once
#include <string>
#include <chrono>

namespace arp_sweep {

inline constexpr const char* kUnknownVendor = "Unknown";

// One host discovered on the link. Only produced after ip and mac validated.
struct Device {
    std::string ip;
    std::string mac;        // lowercase, separator as reported (':' or '-')
    std::string vendor = kUnknownVendor;
    std::chrono::system_clock::time_point detected_at; // stamped when the line was parsed
};

}
