// include/lifecycle_ngin/risk/sizing.hpp
#pragma once

#include <string>
#include "lifecycle_ngin/core/config_base.hpp"
#include "lifecycle_ngin/position/position.hpp"
#include "lifecycle_ngin/risk/risk_types.hpp"

namespace lifecycle_ngin {

/**
 * @brief Which entry table applies to a buy
 */
enum class EntryKind {
    S1,          // initial uptrend entry
    LATER_STAGE, // S2 retest or S3 discount buy
    FIRST_DIP,   // first pullback after entering S3
    REENTRY      // reclaim after an emergency exit
};

std::string entry_kind_to_string(EntryKind kind);

/**
 * @brief Base fractions for the three tiers of a score
 */
struct TierTable {
    double aggressive{0.0};
    double normal{0.0};
    double patient{0.0};

    double for_tier(Tier tier) const;

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Configuration for table-driven sizing
 */
struct SizingConfig : public ConfigBase {
    // Entries, as a fraction of remaining allocation
    TierTable s1_entry{0.50, 0.30, 0.10};
    TierTable later_entry{0.25, 0.15, 0.05};
    TierTable first_dip_entry{0.40, 0.25, 0.08};

    // Trims, as a fraction of current holdings, keyed by the E tier
    TierTable trim{0.50, 0.10, 0.03};

    // Allocation-risk multipliers
    double min_multiplier{0.3};         // once realized profit covers the allocation
    double max_underwater_boost{0.5};   // entry scale-up when underwater
    double trim_deploy_knee{0.5};       // deployed fraction where trim scaling starts
    double max_trim_boost{2.0};         // extra trim multiple at full deployment

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief Turns a signal and A/E tiers into a size fraction
 */
class PositionSizer {
public:
    explicit PositionSizer(SizingConfig config);

    /**
     * @brief Scale applied to entries: shrinks as realized profit approaches the
     * allocation, grows when averaging down
     */
    double entry_multiplier(const Position& position, Price price) const;

    /**
     * @brief Scale applied to trims: grows toward the cap, shrinks with realized profit
     */
    double trim_multiplier(const Position& position) const;

    /**
     * @brief Entry fraction of remaining allocation, clamped to (0, 1]
     */
    double entry_size(EntryKind kind, Tier a_tier, double multiplier) const;

    /**
     * @brief Trim fraction of holdings, clamped to (0, 1]
     */
    double trim_size(Tier e_tier, double multiplier) const;

    double entry_fraction(EntryKind kind, const ScoreSnapshot& scores, const Position& position,
                          Price price) const;
    double trim_fraction(const ScoreSnapshot& scores, const Position& position) const;

    const SizingConfig& config() const {
        return config_;
    }

private:
    const TierTable& entry_table(EntryKind kind) const;

    SizingConfig config_;
};

}  // namespace lifecycle_ngin
