#include "ArgumentParser.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <iostream>
#include <stdexcept>

namespace arp_sweep {

ArgumentParser::ArgumentParser(){
    specs_ = {
        {"--interface", ArgKind::String, "Network interface for arp-scan (-I)", [](Config& c, const std::string& v){ c.interface = v; }},
        {"--subnet", ArgKind::String, "Target subnet, e.g. 192.168.1.0/24", [](Config& c, const std::string& v){ c.subnet = v; }},
        {"--timeout", ArgKind::Number, "Per-host timeout in seconds (default 5)", [](Config& c, const std::string& v){ c.timeout_seconds = std::stod(v); }},
        {"--watchdog-grace", ArgKind::Number, "Seconds added to --timeout before the scan is killed (default 10)", [](Config& c, const std::string& v){ c.watchdog_grace_seconds = std::stod(v); }},
        {"--arp-scan", ArgKind::String, "arp-scan executable (default: arp-scan on PATH)", [](Config& c, const std::string& v){ c.arp_scan_binary = v; }},
        {"--output", ArgKind::String, "Write JSON to FILE (default stdout)", [](Config& c, const std::string& v){ c.output_file = v; }},
        {"--pretty", ArgKind::None, "Pretty-print JSON", [](Config& c, const std::string&){ c.pretty = true; }},
        {"--compact", ArgKind::None, "Minified JSON output", [](Config& c, const std::string&){ c.compact = true; }},
        {"--ndjson", ArgKind::None, "Emit NDJSON (one device per line)", [](Config& c, const std::string&){ c.ndjson = true; }},
        {"--log-level", ArgKind::String, "error|warn|info|debug|trace", [](Config& c, const std::string& v){ c.log_level = v; }},
        {"--log-json", ArgKind::None, "Structured JSON log lines on stderr", [](Config& c, const std::string&){ c.log_json = true; }},
        {"--check", ArgKind::None, "Report whether arp-scan is available and exit", [](Config& c, const std::string&){ c.check_only = true; }},
        {"--tool-version", ArgKind::None, "Print arp-scan --version and exit", [](Config& c, const std::string&){ c.tool_version_only = true; }},
    };
}

bool ArgumentParser::fail(const std::string& msg){
    error_ = msg; exit_code_ = 2;
    std::cerr << msg << "\n";
    return false;
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_code_ = 0; error_.clear();
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--help"){ print_help(); return false; }
        if(a=="--version"){ print_version(); return false; }
        const FlagSpec* spec = nullptr;
        for(const auto& s : specs_) if(a==s.name){ spec=&s; break; }
        if(!spec) return fail("Unknown arg: " + a);
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i+1>=argc) return fail("Missing value for " + a);
            val = argv[++i];
        }
        try {
            spec->apply(cfg, val);
        } catch(const std::exception&){
            return fail("Invalid number for " + a + ": " + val);
        }
    }
    return true;
}

void ArgumentParser::print_help() const {
    std::cout << "arp-sweep options:\n";
    for(const auto& s : specs_){
        std::string name = s.name;
        if(s.kind==ArgKind::String) name += " VALUE"; else if(s.kind==ArgKind::Number) name += " N";
        std::cout << "  " << name;
        if(name.size() < 30) for(size_t i=name.size(); i<30; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << s.help << "\n";
    }
    std::cout << "  --version                     Print version & exit\n";
    std::cout << "  --help                        Show this help\n";
}

void ArgumentParser::print_version(){
    std::cout << "arp-sweep " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
              << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
              << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

}
