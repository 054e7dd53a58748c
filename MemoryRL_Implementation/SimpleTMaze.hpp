/************************************************************
 * SimpleTMaze.hpp
 *
 * T-maze memory task. The agent walks up a corridor; one cell
 * (the hint) shows which side the goal is on. At the junction
 * it must turn left or right, by which point the hint is gone.
 ************************************************************/

#ifndef SIMPLE_TMAZE_HPP
#define SIMPLE_TMAZE_HPP

#include "IEnv.hpp"

#include <random>
#include <string>

namespace memory_rl {

// CONFIGURATION
struct SimpleTMazeConfig {
    int hallway_length = 2;      // Cells before the junction
    int goal_x = 0;              // -1 (left) or +1 (right); 0 = random each episode
    int hint_position = -1;      // Signal cell; -1 = hallway_length - 1
    unsigned random_seed = 42;   // Reproducibility of random goal sides

    // Rewards
    float step_reward = -1.0f;
    float goal_reward = 10.0f;
    float wrong_side_reward = -10.0f;
};


/**
 * SimpleTMaze
 *
 * Observation: x (0 in the corridor, then -1/+1), y (0..hallway_length),
 * symbol (goal_x at the hint cell, 0 elsewhere). goal_x itself is only
 * visible through get_state().
 *
 * Before the junction the only action is "up". At the junction it is
 * "left" or "right", and either choice ends the episode.
 */
class SimpleTMaze : public IEnv {
public:
    explicit SimpleTMaze(const SimpleTMazeConfig& config = SimpleTMazeConfig());

// IEnv Interface Implementation
    void start_new_episode() override;
    State get_observation() const override;
    ActionList get_actions() const override;
    double react(const Action& action) override;
    bool end_of_episode() const override;
    State get_state() const override;
    std::string get_name() const override;

// Environment Queries
    int get_goal_x() const { return goal_x_; }
    int get_hint_position() const { return hint_position_; }

private:
    int symbol_at(int y) const;
    bool at_junction() const { return y_ == config_.hallway_length; }

    SimpleTMazeConfig config_;
    int hint_position_;

    // Episode state
    int x_;
    int y_;
    int goal_x_;
    bool done_;

    std::mt19937 rng_;
};

} // namespace memory_rl

#endif // SIMPLE_TMAZE_HPP
