#pragma once
#include "Config.h"
#include <string>

namespace arp_sweep {

// Post-parse checks and normalization. Problems are written to stderr and
// reported as false; the caller maps that to exit code 2.
class ConfigValidator {
public:
    bool validate(Config& cfg);
private:
    bool validate_positive(double value, const std::string& flag_name);
};

}
