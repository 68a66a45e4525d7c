// include/lifecycle_ngin/storage/async_audit_sink.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "lifecycle_ngin/storage/audit_sink.hpp"

namespace lifecycle_ngin {

/**
 * @brief Audit sink draining a bounded queue into a writer on a background thread
 *
 * When the queue is full the new record is dropped and counted. Writer
 * failures are logged and counted, never returned to the caller.
 */
class AsyncAuditSink : public AuditSink {
public:
    AsyncAuditSink(std::shared_ptr<AuditWriter> writer, size_t max_queue_size = 10000);
    ~AsyncAuditSink() override;

    AsyncAuditSink(const AsyncAuditSink&) = delete;
    AsyncAuditSink& operator=(const AsyncAuditSink&) = delete;

    void append(AuditRecord record) override;
    void flush() override;

    /**
     * @brief Drain the queue and join the worker; further appends are dropped
     */
    void stop();

    size_t written() const {
        return written_.load();
    }

    size_t dropped() const {
        return dropped_.load();
    }

    size_t write_failures() const {
        return write_failures_.load();
    }

private:
    void worker_loop();

    std::shared_ptr<AuditWriter> writer_;
    size_t max_queue_size_;
    std::string component_id_;

    std::deque<AuditRecord> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    bool stopping_{false};
    size_t in_flight_{0};

    std::atomic<size_t> written_{0};
    std::atomic<size_t> dropped_{0};
    std::atomic<size_t> write_failures_{0};

    std::thread worker_;
};

}  // namespace lifecycle_ngin
