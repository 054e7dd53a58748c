/************************************************************
 * LinearQLearner.cpp
 *
 * Implementation of linear Q-learning over sparse features.
 ************************************************************/

#include "LinearQLearner.hpp"
#include "Errors.hpp"

#include <iostream>
#include <utility>

namespace memory_rl {

std::string QFeature::to_string() const {
    return action.to_string() + "|" + feature.to_string();
}


/////////////////////////////////////////////////////////////
// LinearQLearner Implementation
/////////////////////////////////////////////////////////////

LinearQLearner::LinearQLearner(FeatureExtractor feature_extractor,
                               const LinearQLearnerConfig& config)
    : feature_extractor_(std::move(feature_extractor))
    , config_(config)
    , has_commit_(false)
{
    if (!feature_extractor_) {
        throw InvalidArgumentError("LinearQLearner requires a feature extractor");
    }
    if (!(config_.learning_rate > 0.0 && config_.learning_rate <= 1.0)) {
        throw InvalidArgumentError("LinearQLearner learning_rate must be in (0, 1], got "
                                   + std::to_string(config_.learning_rate));
    }
    if (!(config_.discount_rate >= 0.0 && config_.discount_rate <= 1.0)) {
        throw InvalidArgumentError("LinearQLearner discount_rate must be in [0, 1], got "
                                   + std::to_string(config_.discount_rate));
    }

    std::cout << "[Q-Learning] Initialized linear learner with alpha="
              << config_.learning_rate << ", gamma=" << config_.discount_rate << "\n";
}

void LinearQLearner::start_new_episode() {
    has_commit_ = false;
    committed_features_.clear();
}

Action LinearQLearner::act(const State& observation, const ActionList& actions) {
    Action action = get_best_stored_action(observation, actions);
    commit_action(observation, action);
    return action;
}

Action LinearQLearner::get_best_stored_action(const State& observation,
                                              const ActionList& actions) const {
    if (actions.empty()) {
        throw InvalidArgumentError("LinearQLearner: no actions to choose from");
    }

    const Action* best_action = &actions.front();
    double best_q = get_value(observation, *best_action);

    for (std::size_t i = 1; i < actions.size(); i++) {
        double q = get_value(observation, actions[i]);
        if (q > best_q || (q == best_q && actions[i] < *best_action)) {
            best_q = q;
            best_action = &actions[i];
        }
    }

    return *best_action;
}

double LinearQLearner::get_value(const State& observation, const Action& action) const {
    return sum_weights(extract(observation, action));
}

void LinearQLearner::commit_action(const State& observation, const Action& action) {
    committed_features_ = extract(observation, action);
    has_commit_ = true;
}

void LinearQLearner::observe_reward(const State& observation, double reward,
                                    const ActionList& actions) {
    if (!has_commit_) {
        throw InvalidStateError("LinearQLearner::observe_reward called without a committed action");
    }

    // Bootstrapped target; a terminal observation has no successor value
    double target = reward;
    if (!actions.empty()) {
        Action best = get_best_stored_action(observation, actions);
        target += config_.discount_rate * get_value(observation, best);
    }

    double td_error = target - sum_weights(committed_features_);
    double delta = config_.learning_rate * td_error;
    for (const QFeature& feature : committed_features_) {
        weights_[feature] += delta;
    }

    metrics_.num_updates++;
    metrics_.last_td_error = td_error;
    metrics_.total_abs_td_error += td_error < 0 ? -td_error : td_error;

    has_commit_ = false;
    committed_features_.clear();
}

std::string LinearQLearner::get_name() const {
    return "LinearQLearner";
}

double LinearQLearner::get_weight(const QFeature& feature) const {
    auto it = weights_.find(feature);
    return it == weights_.end() ? 0.0 : it->second;
}

std::map<std::string, double> LinearQLearner::export_weights() const {
    std::map<std::string, double> exported;
    for (const auto& kv : weights_) {
        exported[kv.first.to_string()] = kv.second;
    }
    return exported;
}

void LinearQLearner::print_metrics() const {
    std::cout << "  Updates: " << metrics_.num_updates
              << " | Weights: " << weights_.size()
              << " | Last TD error: " << metrics_.last_td_error
              << " | Mean |TD error|: " << metrics_.mean_abs_td_error() << "\n";
}


std::vector<QFeature> LinearQLearner::extract(const State& observation,
                                              const Action& action) const {
    FeatureSet features = feature_extractor_(observation);
    std::vector<QFeature> result;
    result.reserve(features.size());
    for (const FeatureKey& key : features) {
        result.push_back(QFeature{action, key});
    }
    return result;
}

double LinearQLearner::sum_weights(const std::vector<QFeature>& features) const {
    double total = 0.0;
    for (const QFeature& feature : features) {
        total += get_weight(feature);
    }
    return total;
}

} // namespace memory_rl
