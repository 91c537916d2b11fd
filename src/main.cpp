#include "core/Cli.h"
#include "core/Logging.h"
#include "core/Process.h"
#include <iostream>

using namespace arp_sweep;

int main(int argc, char** argv) {
    Logger& log = Logger::instance();
    log.set_level(LogLevel::Info);
    return run_cli(argc, argv, default_process_runner(), log, std::cout);
}
