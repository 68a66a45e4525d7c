// src/position/in_memory_position_store.cpp

#include "lifecycle_ngin/position/in_memory_position_store.hpp"
#include <algorithm>

namespace lifecycle_ngin {

namespace {

template <typename T>
Result<T> not_found(const PositionKey& key) {
    return make_error<T>(ErrorCode::POSITION_NOT_FOUND, "Position not found: " + key.id(),
                         "InMemoryPositionStore");
}

}  // namespace

Result<void> InMemoryPositionStore::create_position(const Position& position) {
    auto invariants = check_invariants(position);
    if (invariants.is_error()) {
        return invariants;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = position.id();
    if (positions_.count(id)) {
        return make_error<void>(ErrorCode::DUPLICATE_POSITION, "Position already exists: " + id,
                                "InMemoryPositionStore");
    }
    Position stored = position;
    auto now = std::chrono::system_clock::now();
    if (stored.created_at == Timestamp{}) {
        stored.created_at = now;
    }
    stored.updated_at = now;
    positions_.emplace(id, std::move(stored));
    return Result<void>();
}

Result<Position> InMemoryPositionStore::get_position(const PositionKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(key.id());
    if (it == positions_.end()) {
        return not_found<Position>(key);
    }
    return Result<Position>(it->second);
}

std::vector<Position> InMemoryPositionStore::select(
    Timeframe timeframe, std::initializer_list<PositionStatus> statuses) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> selected;
    for (const auto& [_, position] : positions_) {
        if (position.key.timeframe != timeframe) {
            continue;
        }
        if (std::find(statuses.begin(), statuses.end(), position.status) != statuses.end()) {
            selected.push_back(position);
        }
    }
    // Stable order for callers
    std::sort(selected.begin(), selected.end(),
              [](const Position& a, const Position& b) { return a.id() < b.id(); });
    return selected;
}

Result<std::vector<Position>> InMemoryPositionStore::get_eligible_positions(
    Timeframe timeframe) const {
    return select(timeframe, {PositionStatus::WATCHLIST, PositionStatus::ACTIVE});
}

Result<std::vector<Position>> InMemoryPositionStore::get_bootstrap_positions(
    Timeframe timeframe) const {
    return select(timeframe, {PositionStatus::DORMANT});
}

Result<Position> InMemoryPositionStore::record_execution(const PositionKey& key,
                                                         const Fill& fill) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(key.id());
    if (it == positions_.end()) {
        return not_found<Position>(key);
    }

    auto applied = apply_fill(it->second, fill);
    if (applied.is_error()) {
        return applied;
    }
    it->second = applied.value();
    return Result<Position>(it->second);
}

Result<std::optional<Position>> InMemoryPositionStore::claim_execution(
    const PositionKey& key, Timestamp now, std::chrono::seconds window) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(key.id());
    if (it == positions_.end()) {
        return not_found<std::optional<Position>>(key);
    }
    if (execution_blocked(it->second, now, window)) {
        return Result<std::optional<Position>>(std::nullopt);
    }
    it->second.execution_claimed_at = now;
    return Result<std::optional<Position>>(it->second);
}

Result<Position> InMemoryPositionStore::update_status(const PositionKey& key,
                                                      PositionStatus status,
                                                      TransitionOrigin origin) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(key.id());
    if (it == positions_.end()) {
        return not_found<Position>(key);
    }

    auto transition = validate_status_transition(it->second.status, status, origin);
    if (transition.is_error()) {
        return forward_error<Position>(transition, "InMemoryPositionStore");
    }

    Position candidate = it->second;
    candidate.status = status;
    auto invariants = check_invariants(candidate);
    if (invariants.is_error()) {
        return forward_error<Position>(invariants, "InMemoryPositionStore");
    }

    candidate.updated_at = std::chrono::system_clock::now();
    it->second = candidate;
    return Result<Position>(it->second);
}

Result<void> InMemoryPositionStore::refresh_trend_output(const PositionKey& key,
                                                         const TrendOutput& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(key.id());
    if (it == positions_.end()) {
        return not_found<void>(key);
    }
    it->second.features.trend = output;
    if (output.price > 0.0) {
        it->second.last_price = output.price;
    }
    return Result<void>();
}

Result<void> InMemoryPositionStore::refresh_scores(const PositionKey& key,
                                                   const ScoreSnapshot& scores) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(key.id());
    if (it == positions_.end()) {
        return not_found<void>(key);
    }
    it->second.features.scores = scores;
    return Result<void>();
}

Result<void> InMemoryPositionStore::refresh_indicators(const PositionKey& key,
                                                       const IndicatorSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(key.id());
    if (it == positions_.end()) {
        return not_found<void>(key);
    }
    it->second.features.indicators = snapshot;
    return Result<void>();
}

Result<void> InMemoryPositionStore::update_bars_count(const PositionKey& key,
                                                      int64_t bars_count) {
    if (bars_count < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "bars_count must be non-negative",
                                "InMemoryPositionStore");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(key.id());
    if (it == positions_.end()) {
        return not_found<void>(key);
    }
    it->second.bars_count = bars_count;
    return Result<void>();
}

size_t InMemoryPositionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}

}  // namespace lifecycle_ngin
