/**
 * @file lock_guard.hpp
 * @brief Scoped reentrancy flag shared by estimators and solvers
 *
 * Purpose: Sets a plain bool for the lifetime of a scope and clears it on
 * exit, whether the scope returns or throws. Not a mutex: estimators are
 * single-threaded and the flag only rejects calls made from listeners.
 *
 * Sample Input:
 *   { LockGuard guard(locked_); run(); }
 *
 * Expected Output:
 *   locked_ == true inside the scope, false after it
 */

#ifndef RFLOC_UTILS_LOCK_GUARD_HPP
#define RFLOC_UTILS_LOCK_GUARD_HPP

namespace rfloc {

class LockGuard {
public:
    explicit LockGuard(bool& locked) : locked_(locked) { locked_ = true; }
    ~LockGuard() { locked_ = false; }

    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;

private:
    bool& locked_;
};

} // namespace rfloc

#endif // RFLOC_UTILS_LOCK_GUARD_HPP
