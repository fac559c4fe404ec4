// ============================================================================
// CancellationToken.h - Cooperative Cancellation Flag
// ============================================================================

#pragma once

#include "ForensicsExceptions.h"

#include <atomic>

namespace FSV {

class CancellationToken {
public:
    CancellationToken() : m_cancelled(false) {}

    void Cancel() { m_cancelled.store(true, std::memory_order_relaxed); }
    bool IsCancelled() const { return m_cancelled.load(std::memory_order_relaxed); }

    // Throws: OperationCancelledError
    void ThrowIfCancelled() const {
        if (IsCancelled()) {
            throw OperationCancelledError();
        }
    }

private:
    std::atomic<bool> m_cancelled;
};

// Null-tolerant helper for optional tokens.
inline void CheckCancelled(const CancellationToken* token) {
    if (token) {
        token->ThrowIfCancelled();
    }
}

} // namespace FSV
