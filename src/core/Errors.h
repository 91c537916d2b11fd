#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace arp_sweep {

// Base for every failure a scan, availability or version call can surface.
class ScanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ReentrancyError : public ScanError {
public:
    ReentrancyError() : ScanError("ARP scan already in progress") {}
};

class SpawnError : public ScanError {
public:
    SpawnError(const std::string& msg, int err) : ScanError(msg), errno_(err) {}
    int error_code() const noexcept { return errno_; }
private:
    int errno_;
};

class ExitError : public ScanError {
public:
    ExitError(const std::string& tool, int code, std::string stderr_text)
        : ScanError(tool + " failed with exit code " + std::to_string(code) + ": " + stderr_text),
          code_(code), stderr_(std::move(stderr_text)) {}
    int exit_code() const noexcept { return code_; }
    const std::string& stderr_text() const noexcept { return stderr_; }
private:
    int code_;
    std::string stderr_;
};

class TimeoutError : public ScanError {
public:
    explicit TimeoutError(const std::string& msg = "ARP scan timed out") : ScanError(msg) {}
};

class ParseError : public ScanError {
public:
    using ScanError::ScanError;
};

class VersionError : public ScanError {
public:
    VersionError() : ScanError("Failed to get arp-scan version") {}
};

}
