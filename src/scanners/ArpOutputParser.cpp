#include "ArpOutputParser.h"
#include "../core/Logging.h"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace arp_sweep {

static const char* kWhitespace = " \t\r\n\f\v";

std::string ArpOutputParser::trim(const std::string& s){
    auto b = s.find_first_not_of(kWhitespace);
    if(b==std::string::npos) return "";
    auto e = s.find_last_not_of(kWhitespace);
    return s.substr(b, e-b+1);
}

static std::vector<std::string> split_tabs(const std::string& line){
    std::vector<std::string> parts; size_t start=0;
    while(true){
        size_t pos = line.find('\t', start);
        if(pos==std::string::npos){ parts.push_back(line.substr(start)); break; }
        parts.push_back(line.substr(start, pos-start));
        start = pos+1;
    }
    return parts;
}

std::vector<RawDevice> ArpOutputParser::parse_lines(const std::string& output, Logger& log){
    std::vector<RawDevice> out;
    std::istringstream iss(output); std::string line;
    while(std::getline(iss, line)){
        if(trim(line).empty()) continue;
        auto parts = split_tabs(line);
        if(parts.size() < 2){ log.warn("Skipping malformed line: " + line); continue; }
        RawDevice rd; rd.line = line;
        rd.device.ip = trim(parts[0]);
        rd.device.mac = trim(parts[1]);
        std::transform(rd.device.mac.begin(), rd.device.mac.end(), rd.device.mac.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        // An empty vendor field defaults; a whitespace-only one trims to "".
        if(parts.size() >= 3 && !parts[2].empty()) rd.device.vendor = trim(parts[2]);
        rd.device.detected_at = std::chrono::system_clock::now();
        out.push_back(std::move(rd));
    }
    return out;
}

std::vector<Device> ArpOutputParser::parse(const std::string& output, Logger& log){
    std::vector<Device> devices;
    for(auto& rd : parse_lines(output, log)){
        if(is_valid_ip(rd.device.ip) && is_valid_mac(rd.device.mac)) devices.push_back(std::move(rd.device));
        else log.warn("Invalid device data: " + rd.line);
    }
    return devices;
}

bool ArpOutputParser::is_valid_ip(const std::string& ip){
    static const std::regex re(R"(^(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)$)");
    return std::regex_match(ip, re);
}

bool ArpOutputParser::is_valid_mac(const std::string& mac){
    // The backreference pins every separator to the first one.
    static const std::regex re(R"(^[0-9a-f]{2}([:-])(?:[0-9a-f]{2}\1){4}[0-9a-f]{2}$)", std::regex::icase);
    return std::regex_match(mac, re);
}

}
