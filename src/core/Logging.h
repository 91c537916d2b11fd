#pragma once
#include <string>
#include <mutex>
#include <atomic>

namespace arp_sweep {

enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3, Trace=4 };

// Parses "error", "warn", "info", "debug", "trace" (case-insensitive). Returns false on unknown names.
bool parse_log_level(const std::string& name, LogLevel& out);
const char* log_level_name(LogLevel lvl);

class Logger {
public:
    Logger() = default;
    virtual ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Process default. Components take a Logger& and fall back to this one.
    static Logger& instance();

    void set_level(LogLevel lvl) { level_.store(lvl); }
    LogLevel level() const { return level_.load(); }
    void set_json(bool on) { json_.store(on); }
    bool json() const { return json_.load(); }

    void log(LogLevel lvl, const std::string& msg);
    void error(const std::string& m){ log(LogLevel::Error, m); }
    void warn(const std::string& m){ log(LogLevel::Warn, m); }
    void info(const std::string& m){ log(LogLevel::Info, m); }
    void debug(const std::string& m){ log(LogLevel::Debug, m); }
    void trace(const std::string& m){ log(LogLevel::Trace, m); }

protected:
    // Called with the formatted line while the emission lock is held.
    virtual void write_line(LogLevel lvl, const std::string& line);

private:
    std::string format(LogLevel lvl, const std::string& msg) const;
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::atomic<bool> json_{false};
    std::mutex mutex_;
};

}
