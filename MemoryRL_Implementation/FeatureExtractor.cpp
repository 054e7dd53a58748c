#include "FeatureExtractor.hpp"

namespace memory_rl {

FeatureKey FeatureKey::bias() {
    return FeatureKey(Kind::Bias, "_bias", Value::null());
}

FeatureKey FeatureKey::attribute(const std::string& name) {
    return FeatureKey(Kind::Attribute, name, Value::null());
}

FeatureKey FeatureKey::attribute_value(const std::string& name, const Value& value) {
    return FeatureKey(Kind::AttributeValue, name, value);
}

std::string FeatureKey::to_string() const {
    if (kind_ == Kind::AttributeValue) {
        return name_ + "=" + value_.to_string();
    }
    return name_;
}

std::size_t FeatureKey::hash() const {
    std::size_t seed = static_cast<std::size_t>(kind_);
    hash_combine(seed, std::hash<std::string>()(name_));
    hash_combine(seed, value_.hash());
    return seed;
}

bool FeatureKey::operator==(const FeatureKey& other) const {
    return kind_ == other.kind_ && name_ == other.name_ && value_ == other.value_;
}

bool FeatureKey::operator<(const FeatureKey& other) const {
    if (kind_ != other.kind_) {
        return static_cast<int>(kind_) < static_cast<int>(other.kind_);
    }
    if (name_ != other.name_) {
        return name_ < other.name_;
    }
    return value_ < other.value_;
}


FeatureSet AttributeFeatureExtractor::operator()(const State& observation) const {
    FeatureSet features;
    features.insert(FeatureKey::bias());
    for (const auto& kv : observation) {
        bool variable = false;
        for (const std::string& prefix : variable_prefixes) {
            if (kv.first.compare(0, prefix.size(), prefix) == 0) {
                variable = true;
                break;
            }
        }
        if (variable) {
            features.insert(FeatureKey::attribute_value(kv.first, kv.second));
        } else {
            features.insert(FeatureKey::attribute(kv.first));
        }
    }
    return features;
}

} // namespace memory_rl
