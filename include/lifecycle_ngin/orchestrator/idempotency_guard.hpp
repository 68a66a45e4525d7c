// include/lifecycle_ngin/orchestrator/idempotency_guard.hpp
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/core/types.hpp"
#include "lifecycle_ngin/position/position_store.hpp"

namespace lifecycle_ngin {

/**
 * @brief Time-based guard against executing twice on the same position
 *
 * Claims are persisted through the position store before the executor is called,
 * so overlapping ticks in separate processes see each other. A claim is not
 * released when the order fails: the outcome of a failed order is not always
 * known, so the position waits out the window.
 */
class IdempotencyGuard {
public:
    explicit IdempotencyGuard(std::shared_ptr<PositionStore> store,
                              std::chrono::seconds window = std::chrono::seconds(180));

    /**
     * @brief Claim a position for execution at now
     * @return The position as stored at claim time, std::nullopt if it was executed
     *         or claimed within the window, or the store error
     */
    Result<std::optional<Position>> try_claim(const PositionKey& key, Timestamp now);

    std::chrono::seconds window() const {
        return window_;
    }

private:
    std::shared_ptr<PositionStore> store_;
    std::chrono::seconds window_;
};

}  // namespace lifecycle_ngin
