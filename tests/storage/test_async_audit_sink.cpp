#include <gtest/gtest.h>
#include <condition_variable>
#include <mutex>
#include <vector>
#include "../core/test_base.hpp"
#include "lifecycle_ngin/storage/async_audit_sink.hpp"

using namespace lifecycle_ngin;
using namespace lifecycle_ngin::testing;

namespace {

/**
 * @brief Writer that can hold the worker inside write() and fail chosen records
 */
class ControlledWriter : public AuditWriter {
public:
    Result<void> write(const AuditRecord& record) override {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return !blocked_; });

        if (record.reason == "fail") {
            return make_error<void>(ErrorCode::DATABASE_ERROR, "insert failed",
                                    "ControlledWriter");
        }
        ids_.push_back(record.record_id);
        return Result<void>();
    }

    Result<void> flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++flushes_;
        return Result<void>();
    }

    void block() {
        std::lock_guard<std::mutex> lock(mutex_);
        blocked_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            blocked_ = false;
        }
        cv_.notify_all();
    }

    void wait_until_entered() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return entered_; });
    }

    std::vector<std::string> ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ids_;
    }

    int flushes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return flushes_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool blocked_{false};
    bool entered_{false};
    std::vector<std::string> ids_;
    int flushes_{0};
};

AuditRecord make_record(const std::string& id, const std::string& reason = "no_signal") {
    AuditRecord record;
    record.record_id = id;
    record.key = PositionKey{"JUP", "orca", Timeframe::HOUR_1};
    record.reason = reason;
    return record;
}

}  // namespace

class AsyncAuditSinkTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        writer = std::make_shared<ControlledWriter>();
    }

    std::shared_ptr<ControlledWriter> writer;
};

TEST_F(AsyncAuditSinkTest, FlushWritesEverythingInOrder) {
    AsyncAuditSink sink(writer);
    for (int i = 0; i < 50; ++i) {
        sink.append(make_record("r" + std::to_string(i)));
    }
    sink.flush();

    auto ids = writer->ids();
    ASSERT_EQ(ids.size(), 50u);
    EXPECT_EQ(ids.front(), "r0");
    EXPECT_EQ(ids.back(), "r49");
    EXPECT_EQ(sink.written(), 50u);
    EXPECT_GE(writer->flushes(), 1);
}

TEST_F(AsyncAuditSinkTest, DropsWhenQueueFull) {
    writer->block();
    AsyncAuditSink sink(writer, 2);

    sink.append(make_record("r1"));
    writer->wait_until_entered();

    // r1 is in flight, so the queue holds r2 and r3
    sink.append(make_record("r2"));
    sink.append(make_record("r3"));
    sink.append(make_record("r4"));
    EXPECT_EQ(sink.dropped(), 1u);

    writer->release();
    sink.flush();
    EXPECT_EQ(writer->ids(), (std::vector<std::string>{"r1", "r2", "r3"}));
}

TEST_F(AsyncAuditSinkTest, WriteFailuresAreCountedNotThrown) {
    AsyncAuditSink sink(writer);
    sink.append(make_record("r1"));
    sink.append(make_record("r2", "fail"));
    sink.append(make_record("r3"));
    sink.flush();

    EXPECT_EQ(sink.written(), 2u);
    EXPECT_EQ(sink.write_failures(), 1u);
    EXPECT_EQ(writer->ids(), (std::vector<std::string>{"r1", "r3"}));
}

TEST_F(AsyncAuditSinkTest, StopDrainsAndRejectsLateRecords) {
    AsyncAuditSink sink(writer);
    EXPECT_TRUE(StateManager::instance().is_healthy());

    sink.append(make_record("r1"));
    sink.append(make_record("r2"));
    sink.stop();
    EXPECT_EQ(writer->ids().size(), 2u);
    EXPECT_FALSE(StateManager::instance().is_healthy());

    sink.append(make_record("r3"));
    EXPECT_EQ(sink.dropped(), 1u);
    EXPECT_EQ(writer->ids().size(), 2u);

    // Second stop is a no-op
    sink.stop();
}
