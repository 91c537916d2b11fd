#include "Cli.h"
#include "ArgumentParser.h"
#include "Config.h"
#include "ConfigValidator.h"
#include "Errors.h"
#include "JSONWriter.h"
#include "../scanners/ArpScanner.h"
#include <chrono>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace arp_sweep {

static int run_scan(const Config& cfg, ProcessRunner& runner, Logger& log, std::ostream& out){
    ArpScannerOptions opts;
    opts.binary = cfg.arp_scan_binary;
    opts.watchdog_grace = std::chrono::milliseconds(std::llround(cfg.watchdog_grace_seconds * 1000.0));
    ArpScanner scanner(log, runner, opts);

    ScanReport report;
    report.interface = cfg.interface;
    report.subnet = cfg.subnet;
    report.timeout_seconds = cfg.timeout_seconds;
    try {
        report.arp_scan_version = ArpScanner::get_version(runner, cfg.arp_scan_binary, log);
    } catch(const VersionError& ex){
        log.debug(ex.what());
    }

    report.started_at = std::chrono::system_clock::now();
    try {
        report.devices = scanner.scan(cfg.interface, cfg.subnet, cfg.timeout_seconds);
    } catch(const TimeoutError&){
        return TimedOut;
    } catch(const ScanError&){
        return ScanFailed;
    } catch(const std::invalid_argument& ex){
        log.error(ex.what());
        return Usage;
    }
    report.finished_at = std::chrono::system_clock::now();

    JSONWriter writer;
    std::string json = writer.write(report, cfg);
    if(cfg.output_file.empty()){
        out << json;
        if(json.empty() || json.back()!='\n') out << "\n";
        return Ok;
    }
    std::ofstream ofs(cfg.output_file);
    if(!ofs){ log.error("Cannot open output file: " + cfg.output_file); return ScanFailed; }
    ofs << json;
    ofs.flush();
    if(!ofs){ log.error("Failed to write output file: " + cfg.output_file); return ScanFailed; }
    return Ok;
}

int run_cli(int argc, char** argv, ProcessRunner& runner, Logger& log, std::ostream& out){
    try {
        Config cfg;
        ArgumentParser parser;
        if(!parser.parse(argc, argv, cfg)) return parser.exit_code();

        ConfigValidator validator;
        if(!validator.validate(cfg)) return Usage;
        set_config(cfg);

        LogLevel lvl = LogLevel::Info;
        if(parse_log_level(cfg.log_level, lvl)) log.set_level(lvl);
        log.set_json(cfg.log_json);

        if(cfg.check_only){
            bool ok = ArpScanner::check_availability(runner, cfg.arp_scan_binary, log);
            out << (ok ? "arp-scan available\n" : "arp-scan not found\n");
            return ok ? Ok : ToolMissing;
        }

        if(cfg.tool_version_only){
            try {
                out << ArpScanner::get_version(runner, cfg.arp_scan_binary, log) << "\n";
                return Ok;
            } catch(const VersionError& ex){
                log.error(ex.what());
                return VersionFailed;
            }
        }

        return run_scan(cfg, runner, log, out);
    } catch(const std::exception& ex){
        log.error(std::string("Fatal: ") + ex.what());
        return ScanFailed;
    }
}

}
