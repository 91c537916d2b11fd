#include "JsonUtil.h"
#include <ctime>
#include <cstdio>

namespace arp_sweep {
namespace jsonutil {

std::string escape(const std::string& s){
    std::string out; out.reserve(s.size()+8);
    for(char c: s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){
                    char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c)); out += buf;
                } else out += c;
        }
    }
    return out;
}

static bool to_utc_tm(std::chrono::system_clock::time_point tp, std::tm& out){
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    return gmtime_r(&t, &out) != nullptr;
}

std::string time_to_iso(std::chrono::system_clock::time_point tp){
    if(tp.time_since_epoch().count()==0) return "";
    std::tm tm{}; if(!to_utc_tm(tp, tm)) return "";
    char buf[32]; std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string time_to_iso_ms(std::chrono::system_clock::time_point tp){
    std::tm tm{}; if(!to_utc_tm(tp, tm)) return "";
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if(ms < 0) ms += 1000;
    char date[32]; std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
    char buf[48]; std::snprintf(buf, sizeof(buf), "%s.%03dZ", date, static_cast<int>(ms));
    return buf;
}

}
}
