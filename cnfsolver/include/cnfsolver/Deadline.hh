/**
 * @file Deadline.hh
 * @brief Time limits and cancellation for solving operations
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef CNFSOLVER_DEADLINE_H
#define CNFSOLVER_DEADLINE_H

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace cnfsolver {

/**
 * @class TimeoutError
 * @brief A solving operation ran past its deadline or was cancelled
 */
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& message = "Operation exceeded its time limit")
        : std::runtime_error(message) {}
};

/**
 * @class Deadline
 * @brief Optional point in time after which solving must stop
 *
 * Copies share one cancellation flag, so a deadline handed to several worker
 * threads can be cancelled for all of them at once. A default-constructed
 * deadline never expires unless cancelled.
 *
 * @code
 * auto deadline = cnfsolver::Deadline::after(std::chrono::milliseconds(500));
 * solver.solve(deadline);  // throws TimeoutError after 500 ms
 * @endcode
 */
class Deadline {
private:
    bool has_limit_;
    std::chrono::steady_clock::time_point limit_;
    std::shared_ptr<std::atomic<bool>> cancelled_;

public:
    Deadline();

    /**
     * @brief Deadline @p duration from now
     */
    static Deadline after(std::chrono::milliseconds duration);

    /**
     * @brief Deadline @p milliseconds from now; 0 means no time limit
     */
    static Deadline from_timeout_ms(long long milliseconds);

    bool has_limit() const { return has_limit_; }

    /**
     * @brief Makes every copy of this deadline expire immediately
     */
    void cancel() const;

    bool expired() const;

    /**
     * @throws TimeoutError if expired
     */
    void check() const;
};

} // namespace cnfsolver

#endif // CNFSOLVER_DEADLINE_H
