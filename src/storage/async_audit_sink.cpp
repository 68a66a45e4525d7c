// src/storage/async_audit_sink.cpp

#include "lifecycle_ngin/storage/async_audit_sink.hpp"
#include "lifecycle_ngin/core/logger.hpp"
#include "lifecycle_ngin/core/state_manager.hpp"

namespace lifecycle_ngin {

AsyncAuditSink::AsyncAuditSink(std::shared_ptr<AuditWriter> writer, size_t max_queue_size)
    : writer_(std::move(writer)),
      max_queue_size_(max_queue_size),
      component_id_(StateManager::make_component_id("AUDIT_SINK")) {
    ComponentInfo info{ComponentType::AUDIT_SINK,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Failed to register audit sink: " << registered.error()->what());
    } else {
        auto running = StateManager::instance().ensure_running(component_id_);
        if (running.is_error()) {
            WARN("Failed to mark audit sink as running: " << running.error()->what());
        }
    }

    worker_ = std::thread(&AsyncAuditSink::worker_loop, this);
}

AsyncAuditSink::~AsyncAuditSink() {
    stop();
}

void AsyncAuditSink::append(AuditRecord record) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            ++dropped_;
            WARN("Audit sink stopped, dropping record for " << record.position_id());
            return;
        }
        if (queue_.size() >= max_queue_size_) {
            ++dropped_;
            ERROR("Audit queue full (" << max_queue_size_ << "), dropping record for "
                                       << record.position_id());
            return;
        }
        queue_.push_back(std::move(record));
    }
    cv_.notify_one();
}

void AsyncAuditSink::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_cv_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
    lock.unlock();

    auto flushed = writer_->flush();
    if (flushed.is_error()) {
        ERROR("Audit writer flush failed: " << flushed.error()->what());
    }
}

void AsyncAuditSink::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    drained_cv_.notify_all();

    auto flushed = writer_->flush();
    if (flushed.is_error()) {
        ERROR("Audit writer flush failed: " << flushed.error()->what());
    }

    std::unordered_map<std::string, double> metrics{
        {"records_written", static_cast<double>(written_.load())},
        {"records_dropped", static_cast<double>(dropped_.load())},
        {"write_failures", static_cast<double>(write_failures_.load())}};
    auto published = StateManager::instance().update_metrics(component_id_, metrics);
    if (published.is_error()) {
        DEBUG("Audit metrics not published: " << published.error()->what());
    }
    auto unregistered = StateManager::instance().unregister_component(component_id_);
    if (unregistered.is_error()) {
        DEBUG("Audit sink was not registered: " << unregistered.error()->what());
    }
}

void AsyncAuditSink::worker_loop() {
    Logger::register_component("AuditSink");
    while (true) {
        AuditRecord record;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                // Stopping with nothing left to write
                break;
            }
            record = std::move(queue_.front());
            queue_.pop_front();
            ++in_flight_;
        }

        auto result = writer_->write(record);
        if (result.is_error()) {
            ++write_failures_;
            ERROR("Failed to write audit record " << record.record_id << " for "
                                                  << record.position_id() << ": "
                                                  << result.error()->what());
        } else {
            ++written_;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_flight_;
        }
        drained_cv_.notify_all();
    }
    drained_cv_.notify_all();
}

}  // namespace lifecycle_ngin
