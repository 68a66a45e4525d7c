// include/lifecycle_ngin/position/position.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/core/types.hpp"
#include "lifecycle_ngin/data/indicator_snapshot.hpp"
#include "lifecycle_ngin/risk/risk_types.hpp"
#include "lifecycle_ngin/trend/trend_types.hpp"

namespace lifecycle_ngin {

/**
 * @brief Lifecycle status of a position
 */
enum class PositionStatus {
    DORMANT,    // not enough history
    WATCHLIST,  // enough history, flat
    ACTIVE,     // holding
    PAUSED,     // manual
    ARCHIVED    // manual
};

std::string position_status_to_string(PositionStatus status);
std::optional<PositionStatus> position_status_from_string(const std::string& text);

/**
 * @brief Who requested a status change
 */
enum class TransitionOrigin { AUTOMATIC, MANUAL };

/**
 * @brief Identity of a position: one per (instrument, venue, timeframe)
 */
struct PositionKey {
    std::string instrument;
    std::string venue;
    Timeframe timeframe{Timeframe::HOUR_1};

    /**
     * @brief Canonical id "<instrument>_<venue>_<timeframe>"
     */
    std::string id() const {
        return instrument + "_" + venue + "_" + timeframe_to_string(timeframe);
    }

    bool operator==(const PositionKey& other) const {
        return instrument == other.instrument && venue == other.venue &&
               timeframe == other.timeframe;
    }

    bool operator!=(const PositionKey& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Cumulative holdings of a position
 *
 * Three running totals are enough to derive deployment and realized profit
 * without replaying the trade ledger.
 */
struct Holdings {
    Quantity quantity{0.0};
    double invested{0.0};   // native currency spent on buys
    double extracted{0.0};  // native currency received from sells

    double net_deployed() const;
    double deployed_fraction(double allocation_cap) const;
    double realized_profit_fraction(double allocation_cap) const;
    double remaining_allocation(double allocation_cap) const;

    /**
     * @brief Cost basis per unit of what is still held, if any
     */
    std::optional<Price> average_entry_price() const;

    /**
     * @brief Return of the held quantity at price against the net deployed amount
     * @return 0 when nothing is deployed
     */
    double unrealised_return(Price price) const;
};

/**
 * @brief Latest derived data cached on a position
 */
struct Features {
    int version{1};
    std::optional<IndicatorSnapshot> indicators;
    std::optional<TrendOutput> trend;
    std::optional<ScoreSnapshot> scores;

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

struct Position {
    PositionKey key;
    PositionStatus status{PositionStatus::DORMANT};
    double allocation_cap{0.0};
    Holdings holdings;
    Features features;
    int64_t bars_count{0};
    std::optional<Timestamp> last_execution_at;
    std::optional<Timestamp> execution_claimed_at;  // set before an order is sent
    Price last_price{0.0};
    Timestamp created_at;
    Timestamp updated_at;

    std::string id() const {
        return key.id();
    }
};

/**
 * @brief Outcome of one executed order, applied to holdings
 */
struct Fill {
    Side side{Side::NONE};
    Quantity quantity{0.0};
    double notional{0.0};
    Price price{0.0};
    std::string tx_reference;
    Timestamp executed_at;
};

/**
 * @brief Check the holdings/status invariants
 * @return INVARIANT_VIOLATION describing the first broken rule
 */
Result<void> check_invariants(const Position& position);

/**
 * @brief Validate a lifecycle transition against the status graph
 */
Result<void> validate_status_transition(PositionStatus from, PositionStatus to,
                                        TransitionOrigin origin);

/**
 * @brief Status implied by holdings for a tradable position
 *
 * Only watchlist and active are driven by holdings; other statuses are returned unchanged.
 */
PositionStatus status_for_quantity(PositionStatus current, Quantity quantity);

/**
 * @brief Apply a fill to a position, updating holdings, status and last execution
 * @return The updated position, or an error if the fill is malformed
 */
Result<Position> apply_fill(const Position& position, const Fill& fill);

/**
 * @brief Whether an execution or an outstanding claim falls inside the window before now
 *
 * Timestamps later than now also block, so skewed clocks between processes err on
 * the side of skipping.
 */
bool execution_blocked(const Position& position, Timestamp now, std::chrono::seconds window);

/**
 * @brief Default split of an upstream allocation across timeframes
 */
const std::map<Timeframe, double>& default_timeframe_splits();

/**
 * @brief Carve a total allocation into per-timeframe caps
 * @return INVALID_ARGUMENT if the total is negative or the splits do not sum to at most 1
 */
Result<std::map<Timeframe, double>> split_allocation(
    double total, const std::map<Timeframe, double>& splits = default_timeframe_splits());

}  // namespace lifecycle_ngin

namespace std {
template <>
struct hash<lifecycle_ngin::PositionKey> {
    size_t operator()(const lifecycle_ngin::PositionKey& key) const {
        return hash<string>()(key.id());
    }
};
}  // namespace std
