/************************************************************
 * FeatureExtractor.hpp
 *
 * Sparse binary features for linear value estimation.
 * An observation maps to a set of keys; a key is the bias, an
 * attribute's presence, or an (attribute, value) pair.
 ************************************************************/

#ifndef FEATURE_EXTRACTOR_HPP
#define FEATURE_EXTRACTOR_HPP

#include "data_structures.h"

#include <functional>
#include <set>
#include <string>
#include <vector>

namespace memory_rl {

class FeatureKey {
public:
    enum class Kind { Bias, Attribute, AttributeValue };

    static FeatureKey bias();
    static FeatureKey attribute(const std::string& name);
    static FeatureKey attribute_value(const std::string& name, const Value& value);

    Kind kind() const { return kind_; }
    const std::string& name() const { return name_; }
    const Value& value() const { return value_; }

    // "_bias", "<attr>" or "<attr>=<value>"
    std::string to_string() const;
    std::size_t hash() const;

    bool operator==(const FeatureKey& other) const;
    bool operator!=(const FeatureKey& other) const { return !(*this == other); }
    bool operator<(const FeatureKey& other) const;

private:
    FeatureKey(Kind kind, const std::string& name, const Value& value)
        : kind_(kind), name_(name), value_(value) {}

    Kind kind_;
    std::string name_;
    Value value_;
};

using FeatureSet = std::set<FeatureKey>;

// Caller-supplied, must be deterministic
using FeatureExtractor = std::function<FeatureSet(const State&)>;


/**
 * Reference extractor.
 *
 * Always emits the bias. Attributes whose name starts with one of
 * variable_prefixes (memory contents, by default) emit
 * (attribute, value); every other attribute emits its name only.
 * An empty prefix matches everything, giving one feature per
 * attribute value.
 */
struct AttributeFeatureExtractor {
    std::vector<std::string> variable_prefixes{"memory_"};

    FeatureSet operator()(const State& observation) const;
};

} // namespace memory_rl

namespace std {

template <>
struct hash<memory_rl::FeatureKey> {
    size_t operator()(const memory_rl::FeatureKey& k) const { return k.hash(); }
};

} // namespace std

#endif // FEATURE_EXTRACTOR_HPP
