// include/lifecycle_ngin/execution/order_executor.hpp
#pragma once

#include <optional>
#include <string>
#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/core/types.hpp"

namespace lifecycle_ngin {

/**
 * @brief Order sent to the execution service
 *
 * Buys are sized by notional (native currency), sells by token quantity.
 */
struct OrderCommand {
    Side side{Side::NONE};
    std::string instrument;
    std::string venue;
    Timeframe timeframe{Timeframe::HOUR_1};
    std::optional<double> notional;
    std::optional<Quantity> quantity;
    Price reference_price{0.0};
    std::string client_order_id;
};

/**
 * @brief Settlement details of a successful order
 */
struct ExecutionReceipt {
    std::string tx_reference;
    Quantity filled_quantity{0.0};
    Price realized_price{0.0};
    double notional{0.0};
    Timestamp executed_at;
};

/**
 * @brief Synchronous, single-attempt order execution
 *
 * Implementations never retry: a failure is returned as ORDER_REJECTED,
 * INSUFFICIENT_FUNDS or EXECUTION_FAILED and recorded by the caller.
 */
class OrderExecutor {
public:
    virtual ~OrderExecutor() = default;

    virtual Result<ExecutionReceipt> execute(const OrderCommand& command) = 0;
};

/**
 * @brief Check the fields every executor relies on
 */
Result<void> validate_order_command(const OrderCommand& command);

}  // namespace lifecycle_ngin
