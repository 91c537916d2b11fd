#pragma once
#include <string>
#include <chrono>

namespace arp_sweep {
namespace jsonutil {

std::string escape(const std::string& s);

// UTC, second precision: 2023-12-25T12:30:45Z. The epoch time_point renders as "" (unset).
std::string time_to_iso(std::chrono::system_clock::time_point tp);

// UTC, millisecond precision: 2023-12-25T12:30:45.123Z
std::string time_to_iso_ms(std::chrono::system_clock::time_point tp);

}
}
