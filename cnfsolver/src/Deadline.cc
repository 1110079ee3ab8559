/**
 * @file Deadline.cc
 * @brief Implementation of solving deadlines
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "cnfsolver/Deadline.hh"

namespace cnfsolver {

Deadline::Deadline()
    : has_limit_(false)
    , limit_()
    , cancelled_(std::make_shared<std::atomic<bool>>(false)) {
}

Deadline Deadline::after(std::chrono::milliseconds duration) {
    Deadline deadline;
    deadline.has_limit_ = true;
    deadline.limit_ = std::chrono::steady_clock::now() + duration;
    return deadline;
}

/**
 * @param milliseconds Time limit; 0 or less gives a deadline without limit
 */
Deadline Deadline::from_timeout_ms(long long milliseconds) {
    if (milliseconds <= 0) {
        return Deadline();
    }
    return after(std::chrono::milliseconds(milliseconds));
}

void Deadline::cancel() const {
    cancelled_->store(true);
}

bool Deadline::expired() const {
    if (cancelled_->load()) {
        return true;
    }
    return has_limit_ && std::chrono::steady_clock::now() >= limit_;
}

/**
 * @throws TimeoutError "Operation cancelled" after cancel(), the default
 *         message once the time limit has passed
 */
void Deadline::check() const {
    if (cancelled_->load()) {
        throw TimeoutError("Operation cancelled");
    }
    if (has_limit_ && std::chrono::steady_clock::now() >= limit_) {
        throw TimeoutError();
    }
}

} // namespace cnfsolver
