// src/execution/paper_order_executor.cpp

#include "lifecycle_ngin/execution/paper_order_executor.hpp"
#include <chrono>
#include "lifecycle_ngin/core/logger.hpp"

namespace lifecycle_ngin {

PaperOrderExecutor::PaperOrderExecutor(PaperExecutorConfig config) : config_(std::move(config)) {}

std::string PaperOrderExecutor::next_tx_reference() {
    return "PAPER_" + std::to_string(++sequence_);
}

Result<ExecutionReceipt> PaperOrderExecutor::execute(const OrderCommand& command) {
    auto valid = validate_order_command(command);
    if (valid.is_error()) {
        return make_error<ExecutionReceipt>(ErrorCode::ORDER_REJECTED, valid.error()->what(),
                                            "PaperOrderExecutor");
    }

    double slip = config_.slippage_bps / 10000.0;
    ExecutionReceipt receipt;
    receipt.executed_at = std::chrono::system_clock::now();

    if (command.side == Side::BUY) {
        receipt.realized_price = command.reference_price * (1.0 + slip);
        receipt.notional = *command.notional;
        receipt.filled_quantity = receipt.notional / receipt.realized_price;
    } else {
        receipt.realized_price = command.reference_price * (1.0 - slip);
        receipt.filled_quantity = *command.quantity;
        receipt.notional = receipt.filled_quantity * receipt.realized_price;
    }

    if (config_.max_order_notional > 0.0 && receipt.notional > config_.max_order_notional) {
        return make_error<ExecutionReceipt>(
            ErrorCode::ORDER_REJECTED,
            "Order notional " + std::to_string(receipt.notional) + " exceeds limit " +
                std::to_string(config_.max_order_notional),
            "PaperOrderExecutor");
    }

    receipt.tx_reference = next_tx_reference();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fills_.push_back(receipt);
    }

    DEBUG("Paper fill " << receipt.tx_reference << " " << side_to_string(command.side) << " "
                        << receipt.filled_quantity << " " << command.instrument << " @ "
                        << receipt.realized_price);
    return receipt;
}

std::vector<ExecutionReceipt> PaperOrderExecutor::fills() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fills_;
}

}  // namespace lifecycle_ngin
