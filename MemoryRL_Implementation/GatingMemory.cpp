#include "GatingMemory.hpp"
#include "Errors.hpp"

#include <iostream>
#include <utility>

namespace memory_rl {

namespace {

const char* const kSlotParameter = "slot";
const char* const kAttributeParameter = "attribute";

} // namespace


// Constructor
GatingMemory::GatingMemory(std::unique_ptr<IEnv> base, const GatingMemoryConfig& config)
    : base_(std::move(base))
    , config_(config)
{
    if (!base_) {
        throw InvalidArgumentError("GatingMemory requires a base environment");
    }
    if (config_.num_memory_slots < 0) {
        throw InvalidArgumentError("GatingMemory num_memory_slots must be >= 0, got "
                                   + std::to_string(config_.num_memory_slots));
    }
    if (config_.memory_prefix.empty() || config_.gate_action_name.empty()) {
        throw InvalidArgumentError("GatingMemory memory_prefix and gate_action_name must be non-empty");
    }

    // Reject names already used by the layers below
    if (base_->reserves_action_name(config_.gate_action_name)) {
        throw InvalidArgumentError("GatingMemory gate_action_name '" + config_.gate_action_name
                                   + "' is already used by " + base_->get_name());
    }
    for (int slot = 0; slot < config_.num_memory_slots; slot++) {
        std::string name = config_.memory_prefix + std::to_string(slot);
        if (base_->is_memory_attribute(name)) {
            throw InvalidArgumentError("GatingMemory slot '" + name
                                       + "' collides with memory of " + base_->get_name());
        }
    }

    slots_.assign(config_.num_memory_slots, Value::null());

    std::cout << "[GatingMemory] Wrapped " << base_->get_name()
              << " with " << config_.num_memory_slots << " slot(s)"
              << ", gate_reward=" << config_.gate_reward << "\n";
}


// IEnv Interface Implementation
void GatingMemory::start_new_episode() {
    for (Value& slot : slots_) {
        slot = Value::null();
    }
    base_->start_new_episode();
}

State GatingMemory::get_observation() const {
    State observation = base_->get_observation();
    if (observation.is_terminal()) {
        return observation;
    }
    return add_memory(observation);
}

ActionList GatingMemory::get_actions() const {
    ActionList actions = base_->get_actions();
    if (actions.empty()) {
        // Terminality is inherited from the base environment
        return actions;
    }

    for (const Action& action : actions) {
        if (action.name() == config_.gate_action_name) {
            throw InvalidStateError("GatingMemory: base action " + action.to_string()
                                    + " collides with gate action name '"
                                    + config_.gate_action_name + "'");
        }
    }

    std::vector<std::string> targets = gate_targets(base_->get_observation());
    for (int slot = 0; slot < num_memory_slots(); slot++) {
        for (const std::string& attribute : targets) {
            actions.emplace_back(config_.gate_action_name,
                                 Action::Parameters{{kSlotParameter, slot},
                                                    {kAttributeParameter, attribute}});
        }
    }
    return actions;
}

double GatingMemory::react(const Action& action) {
    if (base_->end_of_episode()) {
        throw InvalidStateError("GatingMemory::react called after the episode ended");
    }

    if (!is_gate_action(action)) {
        return base_->react(action);
    }

    // Gates are offered only alongside base actions
    if (base_->get_actions().empty()) {
        throw InvalidStateError("GatingMemory: gate action " + action.to_string()
                                + " with no base actions available");
    }

    if (!action.has_parameter(kSlotParameter) || !action.has_parameter(kAttributeParameter)) {
        throw InvalidArgumentError("GatingMemory: malformed gate action " + action.to_string());
    }
    const Value& slot_value = action.get_parameter(kSlotParameter);
    const Value& attribute_value = action.get_parameter(kAttributeParameter);
    if (!slot_value.is_number() || !attribute_value.is_string()) {
        throw InvalidArgumentError("GatingMemory: malformed gate action " + action.to_string());
    }

    double slot_number = slot_value.as_number();
    int slot = static_cast<int>(slot_number);
    if (slot != slot_number || slot < 0 || slot >= num_memory_slots()) {
        throw InvalidArgumentError("GatingMemory: slot " + slot_value.to_string()
                                   + " is out of range for "
                                   + std::to_string(num_memory_slots()) + " slot(s)");
    }

    const std::string& attribute = attribute_value.as_string();
    State base_observation = base_->get_observation();
    if (is_memory_attribute(attribute) || !base_observation.has(attribute)) {
        throw InvalidArgumentError("GatingMemory: '" + attribute + "' is not a gate target");
    }

    slots_[slot] = base_observation.get(attribute);
    return config_.gate_reward;
}

bool GatingMemory::end_of_episode() const {
    return base_->end_of_episode();
}

State GatingMemory::get_state() const {
    return add_memory(base_->get_state());
}

std::string GatingMemory::get_name() const {
    return "GatingMemory(" + base_->get_name() + ", slots="
           + std::to_string(num_memory_slots()) + ")";
}


// Memory Queries
const Value& GatingMemory::memory_value(int slot) const {
    if (slot < 0 || slot >= num_memory_slots()) {
        throw InvalidArgumentError("GatingMemory: no memory slot " + std::to_string(slot));
    }
    return slots_[slot];
}

std::string GatingMemory::slot_attribute(int slot) const {
    return config_.memory_prefix + std::to_string(slot);
}

bool GatingMemory::is_gate_action(const Action& action) const {
    return action.name() == config_.gate_action_name;
}


// Helpers
State GatingMemory::add_memory(const State& base_state) const {
    if (base_state.is_terminal()) {
        return base_state;
    }
    State::Attributes attributes = base_state.attributes();
    for (int slot = 0; slot < num_memory_slots(); slot++) {
        std::string name = slot_attribute(slot);
        if (attributes.count(name) != 0) {
            throw InvalidStateError("GatingMemory: base attribute '" + name
                                    + "' collides with a memory slot; use a different memory_prefix");
        }
        attributes[name] = slots_[slot];
    }
    return State(attributes);
}

std::vector<std::string> GatingMemory::gate_targets(const State& base_observation) const {
    std::vector<std::string> targets;
    for (const auto& kv : base_observation) {
        if (!is_memory_attribute(kv.first)) {
            targets.push_back(kv.first);
        }
    }
    return targets;
}

bool GatingMemory::is_memory_attribute(const std::string& name) const {
    return name.compare(0, config_.memory_prefix.size(), config_.memory_prefix) == 0
           || base_->is_memory_attribute(name);
}

bool GatingMemory::reserves_action_name(const std::string& name) const {
    return name == config_.gate_action_name || base_->reserves_action_name(name);
}

} // namespace memory_rl
