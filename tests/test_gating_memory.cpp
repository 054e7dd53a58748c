#include "GatingMemory.hpp"
#include "GridWorld.hpp"
#include "SimpleTMaze.hpp"
#include "Errors.hpp"

#include <iostream>
#include <cassert>
#include <memory>
#include <set>
#include <string>
#include <utility>

using namespace memory_rl;

// Color codes for output
#define GREEN "\033[32m"
#define RESET "\033[0m"
#define BLUE "\033[34m"

void print_test_header(const std::string& test_name) {
    std::cout << "\n" << BLUE << "=== " << test_name << " ===" << RESET << "\n";
}

void print_pass(const std::string& msg) {
    std::cout << GREEN << "✓ " << msg << RESET << "\n";
}

std::set<Action> action_set(const ActionList& actions) {
    return std::set<Action>(actions.begin(), actions.end());
}

Action gate(int slot, const std::string& attribute, const std::string& name = "gate") {
    return Action(name, {{"slot", slot}, {"attribute", attribute}});
}

std::unique_ptr<GatingMemory> make_tmaze_memory(int goal_x, int slots = 1) {
    SimpleTMazeConfig maze;
    maze.hallway_length = 2;
    maze.hint_position = 1;
    maze.goal_x = goal_x;
    GatingMemoryConfig memory;
    memory.num_memory_slots = slots;
    memory.gate_reward = -0.05;
    return std::make_unique<GatingMemory>(std::make_unique<SimpleTMaze>(maze), memory);
}

State maze_obs(int x, int y, int symbol, const Value& memory) {
    return State({{"x", x}, {"y", y}, {"symbol", symbol}, {"memory_0", memory}});
}

// Test 1: Remember the hint through the junction (random goal side)
void test_tmaze_gating_episode() {
    print_test_header("Test 1: Gated T-Maze Episode");

    std::unique_ptr<GatingMemory> env = make_tmaze_memory(0);
    env->start_new_episode();

    int goal = static_cast<int>(env->get_state().get("goal_x").as_number());
    assert(env->get_state() == State({{"x", 0}, {"y", 0}, {"symbol", 0},
                                      {"goal_x", goal}, {"memory_0", Value::null()}}));
    print_pass("get_state = base state + empty memory");

    const std::set<Action> gates = {gate(0, "x"), gate(0, "y"), gate(0, "symbol")};
    std::set<Action> corridor = gates;
    corridor.insert(Action("up"));

    assert(env->get_observation() == maze_obs(0, 0, 0, Value::null()));
    assert(action_set(env->get_actions()) == corridor);
    assert(env->react(Action("up")) == -1);

    assert(env->get_observation() == maze_obs(0, 1, goal, Value::null()));
    assert(action_set(env->get_actions()) == corridor);
    assert(env->react(gate(0, "symbol")) == -0.05);
    print_pass("Gating the hint costs the gate reward");

    assert(env->get_observation() == maze_obs(0, 1, goal, goal));
    assert(action_set(env->get_actions()) == corridor);
    assert(env->react(Action("up")) == -1);

    std::set<Action> junction = gates;
    junction.insert(Action("left"));
    junction.insert(Action("right"));
    assert(env->get_observation() == maze_obs(0, 2, 0, goal));
    assert(action_set(env->get_actions()) == junction);
    print_pass("Memory keeps the hint after the symbol reverts to 0");

    assert(env->react(Action(goal == -1 ? "right" : "left")) == -10);
    assert(env->end_of_episode());
    assert(env->get_observation().is_terminal());
    assert(env->get_actions().empty());
    print_pass("Wrong side -10, terminal inherited from the base");
}

// Test 2: Memory resets and survives base moves
void test_memory_lifecycle() {
    print_test_header("Test 2: Memory Slot Lifecycle");

    std::unique_ptr<GatingMemory> env = make_tmaze_memory(1, 3);
    env->start_new_episode();
    for (int slot = 0; slot < 3; slot++) {
        assert(env->get_observation().get("memory_" + std::to_string(slot)).is_null());
    }
    print_pass("All 3 slots null after start_new_episode");

    env->react(Action("up"));
    assert(env->react(gate(2, "symbol")) == -0.05);
    assert(env->react(gate(0, "y")) == -0.05);
    assert(env->memory_value(2) == Value(1));
    assert(env->memory_value(0) == Value(1));
    assert(env->memory_value(1).is_null());

    // Gating does not advance the base environment
    assert(env->get_observation().get("y") == Value(1));

    env->react(Action("up"));
    State observation = env->get_observation();
    assert(observation.get("symbol") == Value(0));
    assert(observation.get("y") == Value(2));
    assert(observation.get("memory_2") == Value(1));
    assert(observation.get("memory_0") == Value(1));
    print_pass("Gated values unchanged by base moves");

    // Re-gating the same unchanged value still costs the gate reward
    assert(env->react(gate(1, "x")) == -0.05);
    assert(env->react(gate(1, "x")) == -0.05);
    assert(env->memory_value(1) == Value(0));
    print_pass("Re-gating an unchanged value is idempotent and charged");

    env->react(Action("right"));
    env->start_new_episode();
    for (int slot = 0; slot < 3; slot++) {
        assert(env->memory_value(slot).is_null());
    }
    print_pass("Memory cleared on the next episode");
}

// Test 3: Wrapping GridWorld: action counts and permissive base moves
void test_gridworld_memory() {
    print_test_header("Test 3: GridWorld With Memory");

    GridWorldConfig grid;
    grid.width = 2;
    grid.height = 3;
    grid.start = {0, 0};
    grid.goal = {2, 0};
    GatingMemoryConfig memory;
    memory.num_memory_slots = 2;
    memory.gate_reward = -0.5;
    GatingMemory env(std::make_unique<GridWorld>(grid), memory);
    env.start_new_episode();

    // 2 moves + 2 slots x {row, col}
    ActionList actions = env.get_actions();
    assert(actions.size() == 6);
    assert(actions[0] == Action("down") || actions[0] == Action("right"));
    print_pass("Base actions first, then one gate per (slot, attribute)");

    // memory attributes are never gate targets
    for (const Action& action : actions) {
        if (env.is_gate_action(action)) {
            const std::string& attribute = action.get_parameter("attribute").as_string();
            assert(attribute == "row" || attribute == "col");
        }
    }
    print_pass("memory_* attributes not offered as gate targets");

    bool threw = false;
    try { env.react(gate(0, "memory_1")); } catch (const InvalidArgumentError&) { threw = true; }
    assert(threw);
    threw = false;
    try { env.react(gate(2, "row")); } catch (const InvalidArgumentError&) { threw = true; }
    assert(threw);
    threw = false;
    try { env.react(gate(0, "altitude")); } catch (const InvalidArgumentError&) { threw = true; }
    assert(threw);
    print_pass("Bad slot or attribute rejected");

    // Wall move still forwarded and charged by the base
    assert(env.react(Action("up")) == -1);
    assert(env.react(gate(1, "col")) == -0.5);
    assert(env.react(Action("down")) == -1);
    assert(env.react(Action("down")) == 1);
    assert(env.end_of_episode());
    assert(env.get_actions().empty());

    threw = false;
    try { env.react(gate(0, "row")); } catch (const InvalidStateError&) { threw = true; }
    assert(threw);
    print_pass("Gate after termination raises InvalidStateError");
}

// Test 4: Zero slots is a transparent wrapper
void test_zero_slots() {
    print_test_header("Test 4: Zero Memory Slots");

    SimpleTMazeConfig maze;
    maze.goal_x = -1;
    GatingMemoryConfig memory;
    memory.num_memory_slots = 0;
    GatingMemory env(std::make_unique<SimpleTMaze>(maze), memory);
    env.start_new_episode();

    assert(env.get_observation() == env.base().get_observation());
    assert(env.get_actions() == env.base().get_actions());
    print_pass("Observation and actions identical to the base");
}

// Test 5: Memory over memory
void test_nested_memory() {
    print_test_header("Test 5: Nested Gating Memory");

    SimpleTMazeConfig maze;
    maze.goal_x = 1;
    GatingMemoryConfig inner;
    inner.num_memory_slots = 1;
    GatingMemoryConfig outer;
    outer.num_memory_slots = 1;
    outer.gate_reward = -0.25;
    outer.memory_prefix = "scratch_";
    outer.gate_action_name = "store";

    std::unique_ptr<IEnv> inner_env =
        std::make_unique<GatingMemory>(std::make_unique<SimpleTMaze>(maze), inner);
    GatingMemory env(std::move(inner_env), outer);
    env.start_new_episode();

    State observation = env.get_observation();
    assert(observation.size() == 5);
    assert(observation.get("memory_0").is_null());
    assert(observation.get("scratch_0").is_null());
    assert(env.is_memory_attribute("memory_0"));
    assert(env.is_memory_attribute("scratch_0"));
    assert(!env.is_memory_attribute("symbol"));

    // up + 3 inner gates + 3 outer gates (x, y, symbol)
    ActionList actions = env.get_actions();
    assert(actions.size() == 7);
    std::set<Action> offered = action_set(actions);
    assert(offered.count(gate(0, "symbol", "store")) == 1);
    assert(offered.count(gate(0, "memory_0", "store")) == 0);
    assert(offered.count(gate(0, "scratch_0", "store")) == 0);
    print_pass("Neither layer's memory is offered as a gate target");

    bool threw = false;
    try { env.react(gate(0, "memory_0", "store")); } catch (const InvalidArgumentError&) { threw = true; }
    assert(threw);
    print_pass("Copying one slot into another rejected");

    env.react(Action("up"));
    assert(env.react(gate(0, "symbol")) == -0.05);           // inner gate
    assert(env.react(gate(0, "symbol", "store")) == -0.25);  // outer gate
    env.react(Action("up"));
    observation = env.get_observation();
    assert(observation.get("symbol") == Value(0));
    assert(observation.get("memory_0") == Value(1));
    assert(observation.get("scratch_0") == Value(1));
    assert(env.react(Action("right")) == 10);
    assert(env.end_of_episode());
    print_pass("Each layer routes its own gates and forwards the rest");
}

// Minimal hand-driven environment for wrapper edge cases
class FixedEnv : public IEnv {
public:
    FixedEnv(const State& observation, const ActionList& actions)
        : observation_(observation), actions_(actions) {}

    void start_new_episode() override {}
    State get_observation() const override { return observation_; }
    ActionList get_actions() const override { return actions_; }
    double react(const Action&) override { return 0.0; }
    bool end_of_episode() const override { return false; }
    std::string get_name() const override { return "FixedEnv"; }

private:
    State observation_;
    ActionList actions_;
};

// Test 6: Clashing names are reported at construction
void test_nested_collision() {
    print_test_header("Test 6: Nested Name Collisions");

    SimpleTMazeConfig maze;
    maze.goal_x = 1;
    GatingMemoryConfig defaults;

    GatingMemoryConfig same_prefix;
    same_prefix.gate_action_name = "store";
    GatingMemoryConfig same_gate;
    same_gate.memory_prefix = "scratch_";

    for (const GatingMemoryConfig& outer : {defaults, same_prefix, same_gate}) {
        std::unique_ptr<IEnv> inner_env =
            std::make_unique<GatingMemory>(std::make_unique<SimpleTMaze>(maze), defaults);
        bool threw = false;
        try {
            GatingMemory env(std::move(inner_env), outer);
        } catch (const InvalidArgumentError&) {
            threw = true;
        }
        assert(threw);
    }
    print_pass("Reused prefix or gate name rejected before the first episode");

    // Plain bases can only be checked once they are observed
    GatingMemory literal(std::make_unique<FixedEnv>(State().with("memory_0", 7),
                                                   ActionList{Action("gate")}),
                         defaults);
    bool threw = false;
    try { literal.get_observation(); } catch (const InvalidStateError&) { threw = true; }
    assert(threw);
    threw = false;
    try { literal.get_actions(); } catch (const InvalidStateError&) { threw = true; }
    assert(threw);
    print_pass("Base attribute or action named like a slot or gate raises InvalidStateError");

    GatingMemoryConfig bad;
    bad.num_memory_slots = -1;
    threw = false;
    try {
        GatingMemory negative(std::make_unique<SimpleTMaze>(maze), bad);
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    assert(threw);
    print_pass("Negative slot count rejected");
}

// Test 7: No gating once the base offers no actions
void test_gate_without_base_actions() {
    print_test_header("Test 7: Gating With No Base Actions");

    GridWorldConfig single;
    GatingMemory finished(std::make_unique<GridWorld>(single), GatingMemoryConfig());
    finished.start_new_episode();
    assert(finished.end_of_episode());
    assert(finished.get_actions().empty());
    assert(finished.get_observation().is_terminal());
    bool threw = false;
    try { finished.react(gate(0, "row")); } catch (const InvalidStateError&) { threw = true; }
    assert(threw);
    print_pass("1x1 grid: episode over, gate rejected");

    GatingMemory stalled(std::make_unique<FixedEnv>(State().with("x", 3), ActionList()),
                         GatingMemoryConfig());
    assert(stalled.get_actions().empty());
    threw = false;
    try { stalled.react(gate(0, "x")); } catch (const InvalidStateError&) { threw = true; }
    assert(threw);
    assert(stalled.memory_value(0).is_null());
    print_pass("Gate not accepted when none is advertised");
}

int main() {
    std::cout << BLUE << "\n╔════════════════════════════════════════╗\n";
    std::cout << "║   Gating Memory Test Suite             ║\n";
    std::cout << "╚════════════════════════════════════════╝" << RESET << "\n";

    test_tmaze_gating_episode();
    test_memory_lifecycle();
    test_gridworld_memory();
    test_zero_slots();
    test_nested_memory();
    test_nested_collision();
    test_gate_without_base_actions();

    std::cout << "\n" << GREEN << "All gating memory tests passed" << RESET << "\n";
    return 0;
}
