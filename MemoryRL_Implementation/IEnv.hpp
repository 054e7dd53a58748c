/************************************************************
 * IEnv.hpp
 *
 * Minimal RL environment interface.
 * Environments are episodic state machines: the driver starts
 * an episode, reads observation + available actions, reacts,
 * and stops once end_of_episode() is true.
 ************************************************************/

#ifndef IENV_HPP
#define IENV_HPP

#include "data_structures.h"

#include <string>

namespace memory_rl
{

    // ABSTRACT ENVIRONMENT INTERFACE

    /**
     * IEnv - Minimal interface for RL environments.
     *
     * Implementations:
     * - GridWorld: rectangular navigation task
     * - SimpleTMaze: corridor with a goal-side signal
     * - GatingMemory: decorator adding memory slots to any IEnv
     * - PythonEnv: bridge to an environment written in Python
     */
    class IEnv
    {
    public:
        virtual ~IEnv() = default;

        // Re-initialize internal state, clear termination
        virtual void start_new_episode() = 0;

        // What the agent perceives; State::terminal() once ended
        virtual State get_observation() const = 0;

        // Available actions; empty iff the episode has ended
        virtual ActionList get_actions() const = 0;

        // Apply action, return reward. Throws InvalidStateError after termination
        virtual double react(const Action &action) = 0;

        virtual bool end_of_episode() const = 0;

        // Full internal state, including hidden variables
        virtual State get_state() const { return get_observation(); }

        // True for observation attributes that hold wrapper memory
        // rather than task state; never offered as gate targets
        virtual bool is_memory_attribute(const std::string &) const { return false; }

        // True for action names claimed by a wrapper for its own actions
        virtual bool reserves_action_name(const std::string &) const { return false; }

        // Get environment name for logging
        virtual std::string get_name() const = 0;
    };

} // namespace memory_rl

#endif // IENV_HPP
