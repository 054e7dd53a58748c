#include "GridWorld.hpp"
#include "Errors.hpp"

#include <iostream>

namespace memory_rl {

namespace {

const char* const kMoves[] = {"up", "down", "left", "right"};

std::string cell_to_string(const std::pair<int, int>& cell) {
    return "(" + std::to_string(cell.first) + ", " + std::to_string(cell.second) + ")";
}

} // namespace


// Constructor
GridWorld::GridWorld(const GridWorldConfig& config)
    : config_(config)
    , row_(config.start.first)
    , col_(config.start.second)
    , done_(config.start == config.goal)
{
    if (config_.width < 1 || config_.height < 1) {
        throw InvalidArgumentError("GridWorld dimensions must be positive, got "
                                   + std::to_string(config_.width) + "x"
                                   + std::to_string(config_.height));
    }
    if (!in_bounds(config_.start.first, config_.start.second)) {
        throw InvalidArgumentError("GridWorld start " + cell_to_string(config_.start)
                                   + " is outside the grid");
    }
    if (!in_bounds(config_.goal.first, config_.goal.second)) {
        throw InvalidArgumentError("GridWorld goal " + cell_to_string(config_.goal)
                                   + " is outside the grid");
    }

    std::cout << "[GridWorld] Initialized " << config_.width << "x" << config_.height
              << " grid, start=" << cell_to_string(config_.start)
              << ", goal=" << cell_to_string(config_.goal) << "\n";
}


// IEnv Interface Implementation
void GridWorld::start_new_episode() {
    row_ = config_.start.first;
    col_ = config_.start.second;
    // Starting on the goal is an already finished episode
    done_ = at_goal();
}

State GridWorld::get_observation() const {
    if (done_) {
        return State::terminal();
    }
    return State({{"row", row_}, {"col", col_}});
}

ActionList GridWorld::get_actions() const {
    ActionList actions;
    if (done_) {
        return actions;
    }
    for (const char* name : kMoves) {
        std::pair<int, int> delta = move_delta(name);
        if (in_bounds(row_ + delta.first, col_ + delta.second)) {
            actions.emplace_back(name);
        }
    }
    return actions;
}

double GridWorld::react(const Action& action) {
    if (done_) {
        throw InvalidStateError("GridWorld::react called after the episode ended");
    }

    std::pair<int, int> delta = move_delta(action.name());
    int row = row_ + delta.first;
    int col = col_ + delta.second;

    // Walls clamp the move to a no-op
    if (in_bounds(row, col)) {
        row_ = row;
        col_ = col;
    }

    if (at_goal()) {
        done_ = true;
        return 1.0;
    }
    return -1.0;
}

bool GridWorld::end_of_episode() const {
    return done_;
}

std::string GridWorld::get_name() const {
    return "GridWorld-" + std::to_string(config_.width) + "x" + std::to_string(config_.height);
}


// Helpers
bool GridWorld::at_goal() const {
    return row_ == config_.goal.first && col_ == config_.goal.second;
}

bool GridWorld::in_bounds(int row, int col) const {
    return row >= 0 && row < config_.height && col >= 0 && col < config_.width;
}

std::pair<int, int> GridWorld::move_delta(const std::string& name) {
    if (name == "up") return {-1, 0};
    if (name == "down") return {1, 0};
    if (name == "left") return {0, -1};
    if (name == "right") return {0, 1};
    throw InvalidArgumentError("GridWorld has no action '" + name + "'");
}

} // namespace memory_rl
