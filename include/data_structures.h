#ifndef DATA_STRUCTURES_H
#define DATA_STRUCTURES_H

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace memory_rl {

/**
 * Attribute value: null, a number, or a string.
 * Ordered null < number < string, then naturally within a kind.
 */
class Value {
public:
    enum class Kind { Null, Number, String };

    Value() : kind_(Kind::Null), number_(0.0) {}
    Value(double number) : kind_(Kind::Number), number_(number) {}
    Value(int number) : kind_(Kind::Number), number_(number) {}
    Value(const char* text) : kind_(Kind::String), number_(0.0), text_(text) {}
    Value(const std::string& text) : kind_(Kind::String), number_(0.0), text_(text) {}

    static Value null() { return Value(); }

    Kind kind() const { return kind_; }
    bool is_null() const { return kind_ == Kind::Null; }
    bool is_number() const { return kind_ == Kind::Number; }
    bool is_string() const { return kind_ == Kind::String; }

    // Throws InvalidArgumentError on a kind mismatch
    double as_number() const;
    const std::string& as_string() const;

    std::string to_string() const;
    std::size_t hash() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }
    bool operator<(const Value& other) const;

private:
    Kind kind_;
    double number_;
    std::string text_;
};


/**
 * Observation / state snapshot - immutable attribute -> value record.
 *
 * Attributes are kept sorted by name, so equality and hashing do not
 * depend on the order attributes were supplied in.
 */
class State {
public:
    using Attributes = std::map<std::string, Value>;
    using const_iterator = Attributes::const_iterator;

    State() : terminal_(false) {}
    explicit State(const Attributes& attributes)
        : attributes_(attributes), terminal_(false) {}

    // Sentinel for "episode terminated"
    static State terminal();

    bool is_terminal() const { return terminal_; }

    bool has(const std::string& name) const;
    const Value& get(const std::string& name) const;

    // Copy with one attribute added or replaced
    State with(const std::string& name, const Value& value) const;

    const Attributes& attributes() const { return attributes_; }
    const_iterator begin() const { return attributes_.begin(); }
    const_iterator end() const { return attributes_.end(); }
    std::size_t size() const { return attributes_.size(); }
    bool empty() const { return attributes_.empty(); }

    std::string to_string() const;
    std::size_t hash() const;

    bool operator==(const State& other) const;
    bool operator!=(const State& other) const { return !(*this == other); }
    bool operator<(const State& other) const;

private:
    Attributes attributes_;
    bool terminal_;
};


/**
 * Action - a name plus optional named parameters.
 *
 * Plain moves carry no parameters; composite actions such as
 * Action("gate", {{"slot", 0}, {"attribute", "symbol"}}) do.
 * Ordered by name, then by the sorted parameter list.
 */
class Action {
public:
    using Parameters = std::map<std::string, Value>;

    Action() {}
    explicit Action(const std::string& name) : name_(name) {}
    Action(const std::string& name, const Parameters& parameters)
        : name_(name), parameters_(parameters) {}

    const std::string& name() const { return name_; }
    const Parameters& parameters() const { return parameters_; }

    bool has_parameter(const std::string& key) const;
    const Value& get_parameter(const std::string& key) const;

    std::string to_string() const;
    std::size_t hash() const;

    bool operator==(const Action& other) const;
    bool operator!=(const Action& other) const { return !(*this == other); }
    bool operator<(const Action& other) const;

private:
    std::string name_;
    Parameters parameters_;
};

using ActionList = std::vector<Action>;

// Combine a hash into a running seed
inline void hash_combine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace memory_rl

namespace std {

template <>
struct hash<memory_rl::Value> {
    size_t operator()(const memory_rl::Value& v) const { return v.hash(); }
};

template <>
struct hash<memory_rl::State> {
    size_t operator()(const memory_rl::State& s) const { return s.hash(); }
};

template <>
struct hash<memory_rl::Action> {
    size_t operator()(const memory_rl::Action& a) const { return a.hash(); }
};

} // namespace std

#endif // DATA_STRUCTURES_H
