/************************************************************
 * EpsilonGreedy.hpp
 *
 * Exploration decorator for any IAgent.
 *
 * Epsilon-Greedy:
 * - With probability epsilon: random action (explore)
 * - With probability 1-epsilon: wrapped agent's best action (exploit)
 ************************************************************/

#ifndef EPSILON_GREEDY_HPP
#define EPSILON_GREEDY_HPP

#include "IAgent.hpp"

#include <memory>
#include <random>
#include <string>

namespace memory_rl {

// CONFIGURATION
struct EpsilonGreedyConfig {
    double exploration_rate = 0.1;   // Epsilon, in [0, 1]
    unsigned random_seed = 42;       // Reproducibility
};


class EpsilonGreedy : public IAgent {
public:
    EpsilonGreedy(std::unique_ptr<IAgent> agent,
                  const EpsilonGreedyConfig& config = EpsilonGreedyConfig());

    // Disable copy (owns the wrapped agent)
    EpsilonGreedy(const EpsilonGreedy&) = delete;
    EpsilonGreedy& operator=(const EpsilonGreedy&) = delete;

    // Explores or exploits, then commits the choice to the wrapped agent
    Action act(const State& observation, const ActionList& actions) override;

    // Forwarded unchanged
    void start_new_episode() override;
    Action get_best_stored_action(const State& observation,
                                  const ActionList& actions) const override;
    double get_value(const State& observation, const Action& action) const override;
    void commit_action(const State& observation, const Action& action) override;
    void observe_reward(const State& observation, double reward,
                        const ActionList& actions) override;
    std::string get_name() const override;

    IAgent& agent() { return *agent_; }
    const IAgent& agent() const { return *agent_; }

    long long num_explorations() const { return num_explorations_; }

private:
    std::unique_ptr<IAgent> agent_;
    EpsilonGreedyConfig config_;
    std::mt19937 rng_;
    long long num_explorations_;
};

} // namespace memory_rl

#endif // EPSILON_GREEDY_HPP
