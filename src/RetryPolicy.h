#pragma once

#include <QThread>

struct RetryPolicy {
    int attempts = 5;
    int backoffMs = 100;
};

namespace RetryUtils {

/**
 * @brief Runs an operation until it succeeds or the attempts are exhausted.
 * @param policy Attempt count and delay between attempts.
 * @param operation Callable returning true on success.
 * @return True if one attempt succeeded, false otherwise.
 */
template <typename Operation>
bool runWithRetry(const RetryPolicy &policy, Operation operation)
{
    const int attempts = policy.attempts < 1 ? 1 : policy.attempts;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (operation()) {
            return true;
        }
        if (attempt < attempts && policy.backoffMs > 0) {
            QThread::msleep(static_cast<unsigned long>(policy.backoffMs) * attempt);
        }
    }
    return false;
}

} // namespace RetryUtils
