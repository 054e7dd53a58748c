#include "EpsilonGreedy.hpp"
#include "Errors.hpp"

#include <iostream>
#include <utility>

namespace memory_rl {

EpsilonGreedy::EpsilonGreedy(std::unique_ptr<IAgent> agent, const EpsilonGreedyConfig& config)
    : agent_(std::move(agent))
    , config_(config)
    , rng_(config.random_seed)
    , num_explorations_(0)
{
    if (!agent_) {
        throw InvalidArgumentError("EpsilonGreedy requires an agent to wrap");
    }
    if (!(config_.exploration_rate >= 0.0 && config_.exploration_rate <= 1.0)) {
        throw InvalidArgumentError("EpsilonGreedy exploration_rate must be in [0, 1], got "
                                   + std::to_string(config_.exploration_rate));
    }

    std::cout << "[EpsilonGreedy] Wrapped " << agent_->get_name()
              << " with epsilon=" << config_.exploration_rate
              << ", seed=" << config_.random_seed << "\n";
}

Action EpsilonGreedy::act(const State& observation, const ActionList& actions) {
    if (actions.empty()) {
        throw InvalidArgumentError("EpsilonGreedy: no actions to choose from");
    }

    std::uniform_real_distribution<double> uni(0.0, 1.0);

    Action action;
    if (uni(rng_) < config_.exploration_rate) {
        // Explore: random action
        std::uniform_int_distribution<std::size_t> act_dist(0, actions.size() - 1);
        action = actions[act_dist(rng_)];
        num_explorations_++;
    } else {
        // Exploit: best action
        action = agent_->get_best_stored_action(observation, actions);
    }

    agent_->commit_action(observation, action);
    return action;
}

void EpsilonGreedy::start_new_episode() {
    agent_->start_new_episode();
}

Action EpsilonGreedy::get_best_stored_action(const State& observation,
                                             const ActionList& actions) const {
    return agent_->get_best_stored_action(observation, actions);
}

double EpsilonGreedy::get_value(const State& observation, const Action& action) const {
    return agent_->get_value(observation, action);
}

void EpsilonGreedy::commit_action(const State& observation, const Action& action) {
    agent_->commit_action(observation, action);
}

void EpsilonGreedy::observe_reward(const State& observation, double reward,
                                   const ActionList& actions) {
    agent_->observe_reward(observation, reward, actions);
}

std::string EpsilonGreedy::get_name() const {
    return "EpsilonGreedy(" + agent_->get_name() + ")";
}

} // namespace memory_rl
