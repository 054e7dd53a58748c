/************************************************************
 * LinearQLearner.hpp
 *
 * Online Q-learning with a linear value function over sparse
 * binary state-action features.
 *
 * Features:
 * - Caller-supplied feature extractor (observation -> keys)
 * - Weights grown lazily, absent keys read as 0
 * - Deterministic greedy choice (ties -> smallest Action)
 ************************************************************/

#ifndef LINEAR_QLEARNER_HPP
#define LINEAR_QLEARNER_HPP

#include "IAgent.hpp"
#include "FeatureExtractor.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace memory_rl {

/////////////////////////////////////////////////////////////
// CONFIGURATION
/////////////////////////////////////////////////////////////

struct LinearQLearnerConfig {
    double learning_rate = 0.1;    // Alpha, in (0, 1]
    double discount_rate = 0.9;    // Gamma, in [0, 1]
};


/////////////////////////////////////////////////////////////
// STATE-ACTION FEATURES
/////////////////////////////////////////////////////////////

// An observation feature conjoined with the action it is valued for
struct QFeature {
    Action action;
    FeatureKey feature;

    // "<action>|<feature>", e.g. "Action(left)|memory_0=-1"
    std::string to_string() const;

    bool operator==(const QFeature& other) const {
        return action == other.action && feature == other.feature;
    }
};

struct QFeatureHash {
    std::size_t operator()(const QFeature& f) const {
        std::size_t seed = f.action.hash();
        hash_combine(seed, f.feature.hash());
        return seed;
    }
};


/////////////////////////////////////////////////////////////
// TRAINING METRICS
/////////////////////////////////////////////////////////////

struct LearnerMetrics {
    long long num_updates = 0;
    double last_td_error = 0.0;
    double total_abs_td_error = 0.0;

    void reset() {
        num_updates = 0;
        last_td_error = 0.0;
        total_abs_td_error = 0.0;
    }

    double mean_abs_td_error() const {
        return num_updates > 0 ? total_abs_td_error / num_updates : 0.0;
    }
};


/////////////////////////////////////////////////////////////
// LINEAR Q-LEARNING AGENT
/////////////////////////////////////////////////////////////

class LinearQLearner : public IAgent {
public:
    LinearQLearner(FeatureExtractor feature_extractor,
                   const LinearQLearnerConfig& config = LinearQLearnerConfig());

    //--------------------------------------------------------
    // IAgent Interface
    //--------------------------------------------------------

    void start_new_episode() override;
    Action act(const State& observation, const ActionList& actions) override;
    Action get_best_stored_action(const State& observation,
                                  const ActionList& actions) const override;
    double get_value(const State& observation, const Action& action) const override;
    void commit_action(const State& observation, const Action& action) override;
    void observe_reward(const State& observation, double reward,
                        const ActionList& actions) override;
    std::string get_name() const override;

    //--------------------------------------------------------
    // Weights
    //--------------------------------------------------------

    // Weight of one state-action feature (0 if never updated)
    double get_weight(const QFeature& feature) const;

    std::size_t num_weights() const { return weights_.size(); }

    // Canonical string -> weight
    std::map<std::string, double> export_weights() const;

    //--------------------------------------------------------
    // Metrics
    //--------------------------------------------------------

    const LearnerMetrics& get_metrics() const { return metrics_; }

    void print_metrics() const;

private:
    std::vector<QFeature> extract(const State& observation, const Action& action) const;
    double sum_weights(const std::vector<QFeature>& features) const;

    FeatureExtractor feature_extractor_;
    LinearQLearnerConfig config_;

    std::unordered_map<QFeature, double, QFeatureHash> weights_;

    // Features of the committed (observation, action)
    bool has_commit_;
    std::vector<QFeature> committed_features_;

    LearnerMetrics metrics_;
};

} // namespace memory_rl

#endif // LINEAR_QLEARNER_HPP


/************************************************************
 * DESIGN NOTES
 *
 * Value:
 *   Q(s,a) = sum over f in phi(s) of w[(a, f)]
 *
 * Update (after act(s, a), react -> r, next observation s'):
 *   target = r + gamma * max_a' Q(s',a')   (r alone if s' is terminal)
 *   w[(a, f)] += alpha * (target - Q(s,a))  for every f in phi(s)
 ************************************************************/
