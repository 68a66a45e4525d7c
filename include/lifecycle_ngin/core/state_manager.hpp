// include/lifecycle_ngin/core/state_manager.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "lifecycle_ngin/core/error.hpp"
#include "lifecycle_ngin/core/types.hpp"

namespace lifecycle_ngin {

enum class ComponentState { INITIALIZED, RUNNING, PAUSED, ERR_STATE, STOPPED };

enum class ComponentType {
    TREND_ENGINE,
    RISK_SCORER,
    ORCHESTRATOR,
    POSITION_STORE,
    AUDIT_SINK,
    ORDER_EXECUTOR,
    MARKET_DATA,
    PHASE_PROVIDER
};

std::string component_state_to_string(ComponentState state);
std::string component_type_to_string(ComponentType type);

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Process-wide registry of long-lived components and their health
 */
class StateManager {
public:
    static StateManager& instance() {
        static StateManager instance;
        return instance;
    }

    Result<ComponentInfo> get_state(const std::string& component_id) const;

    /**
     * @brief Merge metrics into the component's published metrics
     */
    Result<void> update_metrics(const std::string& component_id,
                                const std::unordered_map<std::string, double>& metrics);
    Result<void> register_component(const ComponentInfo& info);
    Result<void> unregister_component(const std::string& component_id);
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");

    /**
     * @brief Move a component to RUNNING from any state, recovering through INITIALIZED
     */
    Result<void> ensure_running(const std::string& component_id);

    bool is_healthy() const;
    std::vector<std::string> get_all_components() const;

    /**
     * @brief Build an id that is unique within the process ("<prefix>_<n>")
     */
    static std::string make_component_id(const std::string& prefix);

    static void reset_instance() {
        auto& inst = instance();
        std::lock_guard<std::recursive_mutex> lock(inst.mutex_);
        inst.components_.clear();
    }

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    Result<void> validate_transition(ComponentState current_state, ComponentState new_state) const;

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::recursive_mutex mutex_;
    static std::atomic<uint64_t> id_counter_;
};
}  // namespace lifecycle_ngin
