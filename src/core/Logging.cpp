#include "Logging.h"
#include "JsonUtil.h"
#include <iostream>
#include <algorithm>
#include <chrono>
#include <cctype>

namespace arp_sweep {

bool parse_log_level(const std::string& name, LogLevel& out){
    std::string s = name; std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    if(s=="error") { out = LogLevel::Error; return true; }
    if(s=="warn" || s=="warning") { out = LogLevel::Warn; return true; }
    if(s=="info") { out = LogLevel::Info; return true; }
    if(s=="debug") { out = LogLevel::Debug; return true; }
    if(s=="trace") { out = LogLevel::Trace; return true; }
    return false;
}

const char* log_level_name(LogLevel lvl){
    switch(lvl){
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::Trace: return "trace";
    }
    return "info";
}

Logger& Logger::instance(){
    static Logger inst;
    return inst;
}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(static_cast<int>(lvl) > static_cast<int>(level_.load())) return;
    std::string line = format(lvl, msg);
    std::lock_guard<std::mutex> lk(mutex_);
    write_line(lvl, line);
}

std::string Logger::format(LogLevel lvl, const std::string& msg) const {
    if(json_.load()){
        std::string out = "{\"timestamp\":\"";
        out += jsonutil::time_to_iso_ms(std::chrono::system_clock::now());
        out += "\",\"level\":\""; out += log_level_name(lvl);
        out += "\",\"message\":\""; out += jsonutil::escape(msg); out += "\"}";
        return out;
    }
    switch(lvl){
        case LogLevel::Error: return "[ERROR] " + msg;
        case LogLevel::Warn: return "[WARN] " + msg;
        case LogLevel::Info: return "[INFO] " + msg;
        case LogLevel::Debug: return "[DEBUG] " + msg;
        case LogLevel::Trace: return "[TRACE] " + msg;
    }
    return msg;
}

void Logger::write_line(LogLevel, const std::string& line){
    std::cerr << line << '\n';
}

}
