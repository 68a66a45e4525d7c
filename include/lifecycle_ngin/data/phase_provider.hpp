// include/lifecycle_ngin/data/phase_provider.hpp
#pragma once

#include <mutex>
#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/risk/risk_types.hpp"

namespace lifecycle_ngin {

/**
 * @brief Source of the portfolio-wide phase and cut pressure
 */
class PhaseProvider {
public:
    virtual ~PhaseProvider() = default;

    virtual Result<PhaseContext> get_phase_context() = 0;
};

/**
 * @brief Phase provider returning a fixed context, for paper runs and tests
 */
class StaticPhaseProvider : public PhaseProvider {
public:
    explicit StaticPhaseProvider(PhaseContext context) : context_(context) {}

    Result<PhaseContext> get_phase_context() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!available_) {
            return make_error<PhaseContext>(ErrorCode::DATA_NOT_FOUND,
                                            "Phase context unavailable", "StaticPhaseProvider");
        }
        return context_;
    }

    void set_context(const PhaseContext& context) {
        std::lock_guard<std::mutex> lock(mutex_);
        context_ = context;
    }

    void set_available(bool available) {
        std::lock_guard<std::mutex> lock(mutex_);
        available_ = available;
    }

private:
    std::mutex mutex_;
    PhaseContext context_;
    bool available_{true};
};

}  // namespace lifecycle_ngin
