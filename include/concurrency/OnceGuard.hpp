#pragma once

#include <exception>
#include <mutex>

namespace dt::concurrency {

/**
 * Runs an initializer exactly once across threads. If it throws, the failure is cached and every
 * caller, concurrent or later, gets the same exception rethrown instead of a retry.
 */
class OnceGuard {
public:
    template <typename Fn>
    void run(Fn&& fn) {
        std::call_once(flag_, [&] {
            try {
                fn();
            } catch (...) {
                error_ = std::current_exception();
            }
        });
        if (error_) std::rethrow_exception(error_);
    }

private:
    std::once_flag flag_;
    std::exception_ptr error_;
};

}
