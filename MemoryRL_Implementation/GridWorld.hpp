/************************************************************
 * GridWorld.hpp
 *
 * Rectangular navigation task. The agent moves one cell at a
 * time (up/down/left/right) from a start cell to a goal cell.
 ************************************************************/

#ifndef GRIDWORLD_HPP
#define GRIDWORLD_HPP

#include "IEnv.hpp"

#include <string>
#include <utility>

namespace memory_rl {

// CONFIGURATION
struct GridWorldConfig {
    int width = 1;                       // Columns
    int height = 1;                      // Rows
    std::pair<int, int> start{0, 0};     // (row, col)
    std::pair<int, int> goal{0, 0};      // (row, col)
};


/**
 * GridWorld - reward -1 per move, +1 on the move that lands on
 * the goal (which ends the episode).
 *
 * get_actions() only lists moves that stay inside the grid, but
 * react() accepts all four: a move into a wall leaves the position
 * unchanged and still costs -1.
 *
 * An episode whose start cell is the goal is terminal from the
 * outset: no actions are offered and react() throws.
 */
class GridWorld : public IEnv {
public:
    explicit GridWorld(const GridWorldConfig& config);

// IEnv Interface Implementation
    void start_new_episode() override;
    State get_observation() const override;
    ActionList get_actions() const override;
    double react(const Action& action) override;
    bool end_of_episode() const override;
    std::string get_name() const override;

// Environment Queries
    int get_row() const { return row_; }
    int get_col() const { return col_; }
    const GridWorldConfig& get_config() const { return config_; }

private:
    bool at_goal() const;
    bool in_bounds(int row, int col) const;

    // Unit (row, col) delta for a move name; throws on unknown names
    static std::pair<int, int> move_delta(const std::string& name);

    GridWorldConfig config_;
    int row_;
    int col_;
    bool done_;
};

} // namespace memory_rl

#endif // GRIDWORLD_HPP
