/************************************************************
 * IAgent.hpp
 *
 * Minimal interface for action-valued learning agents.
 ************************************************************/

#ifndef IAGENT_HPP
#define IAGENT_HPP

#include "data_structures.h"

#include <string>

namespace memory_rl
{

    /**
     * IAgent
     *
     * Driver protocol per step:
     *   action = agent.act(observation, actions);
     *   reward = env.react(action);
     *   agent.observe_reward(env.get_observation(), reward, env.get_actions());
     *
     * act() commits the (observation, action) pair that the next
     * observe_reward() updates. Wrappers that choose the action
     * themselves report it through commit_action().
     */
    class IAgent
    {
    public:
        virtual ~IAgent() = default;

        // Drop any pending (observation, action) commit
        virtual void start_new_episode() = 0;

        // Choose and commit an action. Throws InvalidArgumentError if actions is empty
        virtual Action act(const State &observation, const ActionList &actions) = 0;

        // Greedy choice, ties broken by the Action order. No side effects
        virtual Action get_best_stored_action(const State &observation,
                                              const ActionList &actions) const = 0;

        virtual double get_value(const State &observation, const Action &action) const = 0;

        // Record the action actually taken from observation
        virtual void commit_action(const State &observation, const Action &action) = 0;

        // One learning step; actions are those available from observation
        // (empty when it is terminal)
        virtual void observe_reward(const State &observation, double reward,
                                    const ActionList &actions) = 0;

        virtual std::string get_name() const = 0;
    };

} // namespace memory_rl

#endif // IAGENT_HPP
