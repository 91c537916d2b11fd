#pragma once
#include "Errors.h"
#include <atomic>

namespace arp_sweep {

// Owns the "scan in progress" flag for as long as it lives. Acquisition is a
// compare-exchange: a second guard on a held flag throws ReentrancyError
// without touching it. Movable so an async task can carry it.
class ScanGuard {
public:
    explicit ScanGuard(std::atomic<bool>& flag) : flag_(&flag) {
        bool expected = false;
        if(!flag.compare_exchange_strong(expected, true)) throw ReentrancyError();
    }
    ScanGuard(ScanGuard&& other) noexcept : flag_(other.flag_) { other.flag_ = nullptr; }
    ScanGuard(const ScanGuard&) = delete;
    ScanGuard& operator=(const ScanGuard&) = delete;
    ScanGuard& operator=(ScanGuard&&) = delete;
    ~ScanGuard(){ if(flag_) flag_->store(false); }
private:
    std::atomic<bool>* flag_;
};

}
