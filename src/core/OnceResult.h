#pragma once
#include <atomic>
#include <exception>
#include <future>
#include <utility>

namespace arp_sweep {

// Result slot that accepts exactly one completion. Competing producers
// (process exit, spawn error, watchdog) call claim() or set_*(); only the
// first succeeds, the rest observe false and must not touch shared state
// guarded by the slot.
template <typename T>
class OnceResult {
public:
    OnceResult() : future_(promise_.get_future()) {}
    OnceResult(const OnceResult&) = delete;
    OnceResult& operator=(const OnceResult&) = delete;

    // Reserves the slot without completing it. Caller must follow with set_value/set_exception(claimed=true).
    bool claim() { bool expected=false; return claimed_.compare_exchange_strong(expected, true); }
    bool resolved() const { return claimed_.load(); }

    bool set_value(T v, bool claimed = false){
        if(!claimed && !claim()) return false;
        promise_.set_value(std::move(v));
        return true;
    }

    bool set_exception(std::exception_ptr e, bool claimed = false){
        if(!claimed && !claim()) return false;
        promise_.set_exception(std::move(e));
        return true;
    }

    // Blocks until a completion was delivered. Rethrows the stored exception.
    T get(){ return future_.get(); }

private:
    std::promise<T> promise_;
    std::future<T> future_;
    std::atomic<bool> claimed_{false};
};

}
