//===== test_utils.hpp =====
#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "../core/test_base.hpp"
#include "lifecycle_ngin/execution/paper_order_executor.hpp"
#include "lifecycle_ngin/position/in_memory_position_store.hpp"
#include "lifecycle_ngin/storage/audit_sink.hpp"

namespace lifecycle_ngin {
namespace testing {

/**
 * @brief Executor mock that fills through a paper executor unless told otherwise
 */
class MockOrderExecutor : public OrderExecutor {
public:
    MockOrderExecutor() {
        ON_CALL(*this, execute(::testing::_))
            .WillByDefault([this](const OrderCommand& command) { return paper_.execute(command); });
    }

    MOCK_METHOD(Result<ExecutionReceipt>, execute, (const OrderCommand& command), (override));

    std::vector<ExecutionReceipt> fills() const {
        return paper_.fills();
    }

private:
    PaperOrderExecutor paper_;
};

/**
 * @brief Audit sink keeping every record in memory
 */
class RecordingAuditSink : public AuditSink {
public:
    void append(AuditRecord record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(std::move(record));
    }

    void flush() override {}

    std::vector<AuditRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    std::vector<AuditRecord> records_of(AuditKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<AuditRecord> matching;
        for (const auto& record : records_) {
            if (record.kind == kind) {
                matching.push_back(record);
            }
        }
        return matching;
    }

    std::vector<AuditRecord> records_for(const std::string& position_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<AuditRecord> matching;
        for (const auto& record : records_) {
            if (record.position_id() == position_id) {
                matching.push_back(record);
            }
        }
        return matching;
    }

private:
    mutable std::mutex mutex_;
    std::vector<AuditRecord> records_;
};

/**
 * @brief In-memory store with injectable failures
 */
class FlakyPositionStore : public InMemoryPositionStore {
public:
    Result<std::vector<Position>> get_eligible_positions(Timeframe timeframe) const override {
        if (fail_listing_) {
            return make_error<std::vector<Position>>(ErrorCode::DATABASE_ERROR,
                                                     "connection lost", "FlakyPositionStore");
        }
        return InMemoryPositionStore::get_eligible_positions(timeframe);
    }

    Result<Position> record_execution(const PositionKey& key, const Fill& fill) override {
        if (failing_fills_.count(key.instrument)) {
            return make_error<Position>(ErrorCode::DATABASE_ERROR, "write timed out",
                                        "FlakyPositionStore");
        }
        return InMemoryPositionStore::record_execution(key, fill);
    }

    Result<std::optional<Position>> claim_execution(const PositionKey& key, Timestamp now,
                                                    std::chrono::seconds window) override {
        if (fail_claims_) {
            return make_error<std::optional<Position>>(ErrorCode::DATABASE_ERROR,
                                                       "lock timeout", "FlakyPositionStore");
        }
        return InMemoryPositionStore::claim_execution(key, now, window);
    }

    void fail_claims(bool fail) {
        fail_claims_ = fail;
    }

    void fail_listing(bool fail) {
        fail_listing_ = fail;
    }

    void fail_fills_for(const std::string& instrument) {
        failing_fills_.insert(instrument);
    }

private:
    bool fail_listing_{false};
    bool fail_claims_{false};
    std::set<std::string> failing_fills_;
};

inline TrendOutput make_signal(TrendState state, Price price, Timestamp computed_at) {
    TrendOutput output;
    output.state = state;
    output.previous_state = state;
    output.price = price;
    output.bar_time = computed_at;
    output.computed_at = computed_at;
    return output;
}

}  // namespace testing
}  // namespace lifecycle_ngin
