#pragma once
#include "Logging.h"
#include "Process.h"
#include <ostream>

namespace arp_sweep {

enum ExitCode { Ok = 0, ScanFailed = 1, Usage = 2, ToolMissing = 3, TimedOut = 4, VersionFailed = 5 };

// One arp-sweep invocation: parse, validate, probe or scan, write JSON to
// `out` or --output. Every failure is logged and mapped to an ExitCode.
int run_cli(int argc, char** argv, ProcessRunner& runner, Logger& log, std::ostream& out);

}
