#pragma once
#include <chrono>
#include <mutex>
#include <string>

namespace hsn_assistance {

// Consecutive-failure breaker. Opens after fail_max failures in a row and
// rejects calls until reset_timeout has elapsed, then lets one trial call
// through (half-open): success closes it, failure re-opens it.
class CircuitBreaker {
public:
    enum class State { CLOSED, OPEN, HALF_OPEN };

    CircuitBreaker(int fail_max, std::chrono::milliseconds reset_timeout)
        : fail_max_(fail_max < 1 ? 1 : fail_max), reset_timeout_(reset_timeout) {}

    // False while open. Moves OPEN -> HALF_OPEN once the timeout has passed.
    bool allow_request() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::OPEN) {
            if (std::chrono::steady_clock::now() - opened_at_ >= reset_timeout_) {
                state_ = State::HALF_OPEN;
                return true;
            }
            return false;
        }
        return true;
    }

    void record_success() {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_ = 0;
        state_ = State::CLOSED;
    }

    // Returns true when this failure tripped the breaker open.
    bool record_failure() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++failures_;
        if (state_ == State::HALF_OPEN || failures_ >= fail_max_) {
            bool tripped = state_ != State::OPEN;
            state_ = State::OPEN;
            opened_at_ = std::chrono::steady_clock::now();
            return tripped;
        }
        return false;
    }

    State state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    int failure_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failures_;
    }

    static std::string state_to_string(State s) {
        switch (s) {
            case State::CLOSED: return "closed";
            case State::OPEN: return "open";
            case State::HALF_OPEN: return "half_open";
        }
        return "closed";
    }

private:
    int fail_max_;
    std::chrono::milliseconds reset_timeout_;
    State state_ = State::CLOSED;
    int failures_ = 0;
    std::chrono::steady_clock::time_point opened_at_{};
    mutable std::mutex mutex_;
};

} // namespace hsn_assistance
