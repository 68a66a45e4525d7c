// src/orchestrator/idempotency_guard.cpp

#include "lifecycle_ngin/orchestrator/idempotency_guard.hpp"

namespace lifecycle_ngin {

IdempotencyGuard::IdempotencyGuard(std::shared_ptr<PositionStore> store,
                                   std::chrono::seconds window)
    : store_(std::move(store)), window_(window) {}

Result<std::optional<Position>> IdempotencyGuard::try_claim(const PositionKey& key,
                                                             Timestamp now) {
    auto claimed = store_->claim_execution(key, now, window_);
    if (claimed.is_error()) {
        return forward_error<std::optional<Position>>(claimed, "IdempotencyGuard");
    }
    return claimed;
}

}  // namespace lifecycle_ngin
