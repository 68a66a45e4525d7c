// src/execution/order_executor.cpp

#include "lifecycle_ngin/execution/order_executor.hpp"
#include <cmath>

namespace lifecycle_ngin {

Result<void> validate_order_command(const OrderCommand& command) {
    if (command.instrument.empty() || command.venue.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Order is missing instrument or venue",
                                "OrderExecutor");
    }
    if (command.reference_price <= 0.0 || !std::isfinite(command.reference_price)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Reference price must be positive",
                                "OrderExecutor");
    }

    switch (command.side) {
        case Side::BUY:
            if (!command.notional || *command.notional <= 0.0 ||
                !std::isfinite(*command.notional)) {
                return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                        "Buy orders need a positive notional", "OrderExecutor");
            }
            break;
        case Side::SELL:
            if (!command.quantity || *command.quantity <= 0.0 ||
                !std::isfinite(*command.quantity)) {
                return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                        "Sell orders need a positive quantity", "OrderExecutor");
            }
            break;
        case Side::NONE:
            return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Order has no side",
                                    "OrderExecutor");
    }

    if (command.client_order_id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Order has no client order id",
                                "OrderExecutor");
    }
    return Result<void>();
}

}  // namespace lifecycle_ngin
