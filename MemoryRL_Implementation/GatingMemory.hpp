/************************************************************
 * GatingMemory.hpp
 *
 * Decorator that adds scratch memory to any IEnv.
 *
 * The wrapped environment's observation gains one attribute per
 * slot (memory_0, memory_1, ...). Its action set gains one gate
 * action per (slot, observed attribute): gating copies the
 * attribute's current value into the slot at a fixed cost,
 * without advancing the base environment.
 ************************************************************/

#ifndef GATING_MEMORY_HPP
#define GATING_MEMORY_HPP

#include "IEnv.hpp"

#include <memory>
#include <string>
#include <vector>

namespace memory_rl {

// CONFIGURATION
struct GatingMemoryConfig {
    int num_memory_slots = 1;
    double gate_reward = -0.05;              // Cost charged per gate action

    // Naming; a nested GatingMemory needs names unused by the layers below it
    std::string memory_prefix = "memory_";   // Slot i is observed as <prefix><i>
    std::string gate_action_name = "gate";
};


class GatingMemory : public IEnv {
public:
    GatingMemory(std::unique_ptr<IEnv> base, const GatingMemoryConfig& config);

    // Disable copy (owns the base environment)
    GatingMemory(const GatingMemory&) = delete;
    GatingMemory& operator=(const GatingMemory&) = delete;

// IEnv Interface Implementation
    void start_new_episode() override;
    State get_observation() const override;
    ActionList get_actions() const override;
    double react(const Action& action) override;
    bool end_of_episode() const override;
    State get_state() const override;
    std::string get_name() const override;

    // This layer's <prefix><i> slots plus every memory attribute below it
    bool is_memory_attribute(const std::string& name) const override;
    bool reserves_action_name(const std::string& name) const override;

// Memory Queries
    int num_memory_slots() const { return static_cast<int>(slots_.size()); }
    const Value& memory_value(int slot) const;
    std::string slot_attribute(int slot) const;

    bool is_gate_action(const Action& action) const;

    const IEnv& base() const { return *base_; }

private:
    // Adds <prefix><i> attributes to a base state
    State add_memory(const State& base_state) const;

    // Attributes of the base observation that may be gated
    std::vector<std::string> gate_targets(const State& base_observation) const;

    std::unique_ptr<IEnv> base_;
    GatingMemoryConfig config_;
    std::vector<Value> slots_;
};

} // namespace memory_rl

#endif // GATING_MEMORY_HPP
