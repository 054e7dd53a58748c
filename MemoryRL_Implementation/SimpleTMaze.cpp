#include "SimpleTMaze.hpp"
#include "Errors.hpp"

#include <iostream>

namespace memory_rl {

// Constructor
SimpleTMaze::SimpleTMaze(const SimpleTMazeConfig& config)
    : config_(config)
    , hint_position_(config.hint_position < 0 ? config.hallway_length - 1
                                              : config.hint_position)
    , x_(0)
    , y_(0)
    , goal_x_(config.goal_x)
    , done_(false)
    , rng_(config.random_seed)
{
    if (config_.hallway_length < 1) {
        throw InvalidArgumentError("SimpleTMaze hallway_length must be at least 1, got "
                                   + std::to_string(config_.hallway_length));
    }
    if (config_.goal_x != 0 && config_.goal_x != -1 && config_.goal_x != 1) {
        throw InvalidArgumentError("SimpleTMaze goal_x must be -1 or 1, got "
                                   + std::to_string(config_.goal_x));
    }
    if (hint_position_ < 0 || hint_position_ >= config_.hallway_length) {
        throw InvalidArgumentError("SimpleTMaze hint_position "
                                   + std::to_string(hint_position_)
                                   + " is outside the hallway");
    }

    start_new_episode();

    std::cout << "[SimpleTMaze] Initialized hallway_length=" << config_.hallway_length
              << ", hint at y=" << hint_position_
              << ", goal_x=" << (config_.goal_x == 0 ? std::string("random")
                                                     : std::to_string(config_.goal_x))
              << "\n";
}


// IEnv Interface Implementation
void SimpleTMaze::start_new_episode() {
    x_ = 0;
    y_ = 0;
    done_ = false;
    if (config_.goal_x != 0) {
        goal_x_ = config_.goal_x;
    } else {
        std::uniform_int_distribution<int> side(0, 1);
        goal_x_ = side(rng_) == 0 ? -1 : 1;
    }
}

State SimpleTMaze::get_observation() const {
    if (done_) {
        return State::terminal();
    }
    return State({{"x", x_}, {"y", y_}, {"symbol", symbol_at(y_)}});
}

ActionList SimpleTMaze::get_actions() const {
    if (done_) {
        return {};
    }
    if (at_junction()) {
        return {Action("left"), Action("right")};
    }
    return {Action("up")};
}

double SimpleTMaze::react(const Action& action) {
    if (done_) {
        throw InvalidStateError("SimpleTMaze::react called after the episode ended");
    }

    const std::string& name = action.name();
    if (!at_junction()) {
        if (name != "up") {
            throw InvalidArgumentError("SimpleTMaze: '" + name
                                       + "' is not available before the junction");
        }
        y_++;
        return config_.step_reward;
    }

    if (name == "left") {
        x_ = -1;
    } else if (name == "right") {
        x_ = 1;
    } else {
        throw InvalidArgumentError("SimpleTMaze: '" + name
                                   + "' is not available at the junction");
    }
    done_ = true;
    return x_ == goal_x_ ? config_.goal_reward : config_.wrong_side_reward;
}

bool SimpleTMaze::end_of_episode() const {
    return done_;
}

State SimpleTMaze::get_state() const {
    return State({{"x", x_}, {"y", y_}, {"symbol", symbol_at(y_)}, {"goal_x", goal_x_}});
}

std::string SimpleTMaze::get_name() const {
    return "SimpleTMaze-" + std::to_string(config_.hallway_length);
}


int SimpleTMaze::symbol_at(int y) const {
    return y == hint_position_ ? goal_x_ : 0;
}

} // namespace memory_rl
