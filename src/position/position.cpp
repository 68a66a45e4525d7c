// src/position/position.cpp

#include "lifecycle_ngin/position/position.hpp"
#include <algorithm>
#include <cmath>

namespace lifecycle_ngin {

namespace {

// Residual quantity treated as flat after a sell
constexpr double QUANTITY_EPSILON = 1e-12;

}  // namespace

std::string position_status_to_string(PositionStatus status) {
    switch (status) {
        case PositionStatus::DORMANT:
            return "dormant";
        case PositionStatus::WATCHLIST:
            return "watchlist";
        case PositionStatus::ACTIVE:
            return "active";
        case PositionStatus::PAUSED:
            return "paused";
        case PositionStatus::ARCHIVED:
            return "archived";
    }
    return "dormant";
}

std::optional<PositionStatus> position_status_from_string(const std::string& text) {
    if (text == "dormant")
        return PositionStatus::DORMANT;
    if (text == "watchlist")
        return PositionStatus::WATCHLIST;
    if (text == "active")
        return PositionStatus::ACTIVE;
    if (text == "paused")
        return PositionStatus::PAUSED;
    if (text == "archived")
        return PositionStatus::ARCHIVED;
    return std::nullopt;
}

double Holdings::net_deployed() const {
    return std::max(0.0, invested - extracted);
}

double Holdings::deployed_fraction(double allocation_cap) const {
    if (allocation_cap <= 0.0) {
        return 0.0;
    }
    return net_deployed() / allocation_cap;
}

double Holdings::realized_profit_fraction(double allocation_cap) const {
    if (allocation_cap <= 0.0) {
        return 0.0;
    }
    return std::max(0.0, extracted - invested) / allocation_cap;
}

double Holdings::remaining_allocation(double allocation_cap) const {
    return std::max(0.0, allocation_cap - net_deployed());
}

std::optional<Price> Holdings::average_entry_price() const {
    if (quantity <= 0.0 || net_deployed() <= 0.0) {
        return std::nullopt;
    }
    return net_deployed() / quantity;
}

double Holdings::unrealised_return(Price price) const {
    double deployed = net_deployed();
    if (deployed <= 0.0 || quantity <= 0.0) {
        return 0.0;
    }
    return (quantity * price - deployed) / deployed;
}

nlohmann::json Features::to_json() const {
    nlohmann::json j;
    j["version"] = version;
    if (indicators) {
        j["indicators"] = indicators->to_json();
    }
    if (trend) {
        j["trend_engine"] = trend->to_json();
    }
    if (scores) {
        j["scores"] = scores->to_json();
    }
    return j;
}

void Features::from_json(const nlohmann::json& j) {
    version = j.value("version", 1);
    if (j.contains("indicators") && j.at("indicators").is_object()) {
        IndicatorSnapshot snapshot;
        snapshot.from_json(j.at("indicators"));
        indicators = snapshot;
    } else {
        indicators.reset();
    }
    if (j.contains("trend_engine") && j.at("trend_engine").is_object()) {
        TrendOutput output;
        output.from_json(j.at("trend_engine"));
        trend = output;
    } else {
        trend.reset();
    }
    if (j.contains("scores") && j.at("scores").is_object()) {
        ScoreSnapshot snapshot;
        snapshot.from_json(j.at("scores"));
        scores = snapshot;
    } else {
        scores.reset();
    }
}

Result<void> check_invariants(const Position& position) {
    const auto quantity = position.holdings.quantity;
    if (quantity < 0.0) {
        return make_error<void>(ErrorCode::INVARIANT_VIOLATION,
                                position.id() + " has negative quantity " +
                                    std::to_string(quantity),
                                "Position");
    }
    if (position.status == PositionStatus::ACTIVE && quantity <= 0.0) {
        return make_error<void>(ErrorCode::INVARIANT_VIOLATION,
                                position.id() + " is active with zero holdings", "Position");
    }
    if (position.status == PositionStatus::WATCHLIST && quantity > 0.0) {
        return make_error<void>(ErrorCode::INVARIANT_VIOLATION,
                                position.id() + " is on the watchlist with holdings " +
                                    std::to_string(quantity),
                                "Position");
    }
    return Result<void>();
}

Result<void> validate_status_transition(PositionStatus from, PositionStatus to,
                                        TransitionOrigin origin) {
    bool valid = false;

    // Lifecycle edges driven by data and executions
    switch (from) {
        case PositionStatus::DORMANT:
            valid = to == PositionStatus::WATCHLIST;
            break;
        case PositionStatus::WATCHLIST:
            valid = to == PositionStatus::ACTIVE || to == PositionStatus::DORMANT;
            break;
        case PositionStatus::ACTIVE:
            valid = to == PositionStatus::WATCHLIST;
            break;
        case PositionStatus::PAUSED:
        case PositionStatus::ARCHIVED:
            valid = false;
            break;
    }

    // Operator edges into and out of paused/archived
    if (!valid && origin == TransitionOrigin::MANUAL) {
        switch (from) {
            case PositionStatus::DORMANT:
            case PositionStatus::WATCHLIST:
            case PositionStatus::ACTIVE:
                valid = to == PositionStatus::PAUSED || to == PositionStatus::ARCHIVED;
                break;
            case PositionStatus::PAUSED:
                valid = to == PositionStatus::WATCHLIST || to == PositionStatus::ACTIVE ||
                        to == PositionStatus::DORMANT || to == PositionStatus::ARCHIVED;
                break;
            case PositionStatus::ARCHIVED:
                valid = to == PositionStatus::WATCHLIST || to == PositionStatus::DORMANT;
                break;
        }
    }

    if (!valid) {
        return make_error<void>(ErrorCode::INVALID_STATUS_TRANSITION,
                                "Invalid status transition " + position_status_to_string(from) +
                                    " -> " + position_status_to_string(to) +
                                    (origin == TransitionOrigin::MANUAL ? " (manual)"
                                                                        : " (automatic)"),
                                "Position");
    }
    return Result<void>();
}

PositionStatus status_for_quantity(PositionStatus current, Quantity quantity) {
    if (current != PositionStatus::WATCHLIST && current != PositionStatus::ACTIVE) {
        return current;
    }
    return quantity > 0.0 ? PositionStatus::ACTIVE : PositionStatus::WATCHLIST;
}

Result<Position> apply_fill(const Position& position, const Fill& fill) {
    if (position.status != PositionStatus::WATCHLIST &&
        position.status != PositionStatus::ACTIVE) {
        return make_error<Position>(ErrorCode::INVALID_STATUS_TRANSITION,
                                    "Cannot record a fill on " + position.id() + " in status " +
                                        position_status_to_string(position.status),
                                    "Position");
    }
    if (fill.quantity <= 0.0 || !std::isfinite(fill.quantity)) {
        return make_error<Position>(ErrorCode::INVALID_ARGUMENT,
                                    "Fill quantity must be positive", "Position");
    }
    if (fill.notional < 0.0 || !std::isfinite(fill.notional)) {
        return make_error<Position>(ErrorCode::INVALID_ARGUMENT,
                                    "Fill notional must be non-negative", "Position");
    }

    Position updated = position;
    switch (fill.side) {
        case Side::BUY:
            updated.holdings.quantity += fill.quantity;
            updated.holdings.invested += fill.notional;
            break;
        case Side::SELL: {
            double remaining = position.holdings.quantity - fill.quantity;
            updated.holdings.quantity = remaining <= QUANTITY_EPSILON ? 0.0 : remaining;
            updated.holdings.extracted += fill.notional;
            break;
        }
        case Side::NONE:
            return make_error<Position>(ErrorCode::INVALID_ARGUMENT, "Fill has no side",
                                        "Position");
    }

    updated.status = status_for_quantity(position.status, updated.holdings.quantity);
    updated.last_execution_at = fill.executed_at;
    if (fill.price > 0.0) {
        updated.last_price = fill.price;
    }
    updated.updated_at = fill.executed_at;
    return updated;
}

bool execution_blocked(const Position& position, Timestamp now, std::chrono::seconds window) {
    auto recent = [&](const std::optional<Timestamp>& then) {
        return then && now - *then < window;
    };
    return recent(position.last_execution_at) || recent(position.execution_claimed_at);
}

const std::map<Timeframe, double>& default_timeframe_splits() {
    static const std::map<Timeframe, double> splits{{Timeframe::MINUTE_1, 0.05},
                                                    {Timeframe::MINUTE_15, 0.125},
                                                    {Timeframe::HOUR_1, 0.70},
                                                    {Timeframe::HOUR_4, 0.125}};
    return splits;
}

Result<std::map<Timeframe, double>> split_allocation(double total,
                                                     const std::map<Timeframe, double>& splits) {
    if (total < 0.0 || !std::isfinite(total)) {
        return make_error<std::map<Timeframe, double>>(
            ErrorCode::INVALID_ARGUMENT, "Total allocation must be non-negative", "Position");
    }

    double sum = 0.0;
    for (const auto& [tf, pct] : splits) {
        if (pct < 0.0) {
            return make_error<std::map<Timeframe, double>>(
                ErrorCode::INVALID_ARGUMENT,
                "Negative split for timeframe " + timeframe_to_string(tf), "Position");
        }
        sum += pct;
    }
    if (sum > 1.0 + 1e-9) {
        return make_error<std::map<Timeframe, double>>(
            ErrorCode::INVALID_ARGUMENT, "Timeframe splits sum to more than 100%", "Position");
    }

    std::map<Timeframe, double> caps;
    for (const auto& [tf, pct] : splits) {
        caps[tf] = total * pct;
    }
    return caps;
}

}  // namespace lifecycle_ngin
