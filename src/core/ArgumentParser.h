#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace arp_sweep {

class ArgumentParser {
public:
    ArgumentParser();

    // Returns false when the program should exit right away: after --help or
    // --version (exit_code()==0) or on a usage error (exit_code()==2, error() set).
    bool parse(int argc, char** argv, Config& cfg);

    int exit_code() const { return exit_code_; }
    const std::string& error() const { return error_; }

    void print_help() const;
    static void print_version();

private:
    enum class ArgKind { None, String, Number };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* help;
        std::function<void(Config&, const std::string&)> apply;
    };
    bool fail(const std::string& msg);

    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
    std::string error_;
};

}
