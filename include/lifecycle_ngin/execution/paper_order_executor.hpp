// include/lifecycle_ngin/execution/paper_order_executor.hpp
#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include "lifecycle_ngin/core/config_base.hpp"
#include "lifecycle_ngin/execution/order_executor.hpp"

namespace lifecycle_ngin {

struct PaperExecutorConfig : public ConfigBase {
    double slippage_bps{0.0};        // adverse, applied to the reference price
    double max_order_notional{0.0};  // 0 disables the limit
    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["slippage_bps"] = slippage_bps;
        j["max_order_notional"] = max_order_notional;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("slippage_bps"))
            slippage_bps = j.at("slippage_bps").get<double>();
        if (j.contains("max_order_notional"))
            max_order_notional = j.at("max_order_notional").get<double>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }

    Result<void> validate() const override {
        if (slippage_bps < 0.0 || max_order_notional < 0.0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Paper executor limits must be non-negative",
                                    "PaperExecutorConfig");
        }
        return Result<void>();
    }
};

/**
 * @brief Fills every valid order in full at the reference price (plus slippage)
 */
class PaperOrderExecutor : public OrderExecutor {
public:
    explicit PaperOrderExecutor(PaperExecutorConfig config = PaperExecutorConfig());

    Result<ExecutionReceipt> execute(const OrderCommand& command) override;

    /**
     * @brief Receipts of all filled orders, in execution order
     */
    std::vector<ExecutionReceipt> fills() const;

private:
    std::string next_tx_reference();

    PaperExecutorConfig config_;
    std::atomic<uint64_t> sequence_{0};
    mutable std::mutex mutex_;
    std::vector<ExecutionReceipt> fills_;
};

}  // namespace lifecycle_ngin
