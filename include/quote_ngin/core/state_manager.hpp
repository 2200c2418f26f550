//===== state_manager.hpp =====
#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "quote_ngin/core/error.hpp"
#include "quote_ngin/core/types.hpp"

namespace quote_ngin {

/**
 * @brief Lifecycle of a supervised actor
 *
 * CREATED -> STARTED -> RUNNING -> STOPPING -> STOPPED, and STOPPED -> STARTED
 * when the supervisor restarts the actor with fresh state.
 */
enum class ComponentState { CREATED, STARTED, RUNNING, STOPPING, STOPPED };

enum class ComponentType { SCHEDULER, DOWNLOADER, PROCESSOR, SINK, SERVICE, OTHER };

std::string component_state_to_string(ComponentState state);

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Registry of actor states and per-actor counters
 *
 * One instance is shared by the supervisors of a pipeline.
 */
class StateManager {
public:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    Result<ComponentInfo> get_state(const std::string& component_id) const;
    Result<void> register_component(const ComponentInfo& info);

    /**
     * @brief Move a component to a new state
     * @param error_message Stored when entering STOPPED after a failure, cleared otherwise
     * @return INVALID_ARGUMENT for unknown components or illegal transitions
     */
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");

    Result<void> increment_metric(const std::string& component_id, const std::string& metric,
                                  double delta = 1.0);

    /**
     * @brief True when every registered component is started or running
     */
    bool is_healthy() const;
    std::vector<std::string> get_all_components() const;

private:
    Result<void> validate_transition(ComponentState current_state,
                                     ComponentState new_state) const;

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::mutex mutex_;
};

}  // namespace quote_ngin
