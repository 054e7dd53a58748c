#include "data_structures.h"
#include "Errors.hpp"

#include <cmath>
#include <sstream>

namespace memory_rl {

/////////////////////////////////////////////////////////////
// Value
/////////////////////////////////////////////////////////////

double Value::as_number() const {
    if (kind_ != Kind::Number) {
        throw InvalidArgumentError("Value " + to_string() + " is not a number");
    }
    return number_;
}

const std::string& Value::as_string() const {
    if (kind_ != Kind::String) {
        throw InvalidArgumentError("Value " + to_string() + " is not a string");
    }
    return text_;
}

std::string Value::to_string() const {
    switch (kind_) {
    case Kind::Null:
        return "None";
    case Kind::Number: {
        // Integral values print without a fractional part
        double integral = 0.0;
        if (std::modf(number_, &integral) == 0.0 && std::fabs(number_) < 1e15) {
            return std::to_string(static_cast<long long>(number_));
        }
        std::ostringstream out;
        out << number_;
        return out.str();
    }
    case Kind::String:
        return text_;
    }
    return "";
}

std::size_t Value::hash() const {
    std::size_t seed = static_cast<std::size_t>(kind_);
    switch (kind_) {
    case Kind::Null:
        break;
    case Kind::Number:
        // -0.0 == 0.0, so both must hash alike
        hash_combine(seed, std::hash<double>()(number_ == 0.0 ? 0.0 : number_));
        break;
    case Kind::String:
        hash_combine(seed, std::hash<std::string>()(text_));
        break;
    }
    return seed;
}

bool Value::operator==(const Value& other) const {
    if (kind_ != other.kind_) return false;
    switch (kind_) {
    case Kind::Null:
        return true;
    case Kind::Number:
        return number_ == other.number_;
    case Kind::String:
        return text_ == other.text_;
    }
    return false;
}

bool Value::operator<(const Value& other) const {
    if (kind_ != other.kind_) {
        return static_cast<int>(kind_) < static_cast<int>(other.kind_);
    }
    switch (kind_) {
    case Kind::Null:
        return false;
    case Kind::Number:
        return number_ < other.number_;
    case Kind::String:
        return text_ < other.text_;
    }
    return false;
}


/////////////////////////////////////////////////////////////
// State
/////////////////////////////////////////////////////////////

State State::terminal() {
    State s;
    s.terminal_ = true;
    return s;
}

bool State::has(const std::string& name) const {
    return attributes_.find(name) != attributes_.end();
}

const Value& State::get(const std::string& name) const {
    auto it = attributes_.find(name);
    if (it == attributes_.end()) {
        throw InvalidArgumentError("State has no attribute '" + name + "'");
    }
    return it->second;
}

State State::with(const std::string& name, const Value& value) const {
    if (terminal_) {
        throw InvalidStateError("Cannot add attribute '" + name + "' to the terminal state");
    }
    State copy(*this);
    copy.attributes_[name] = value;
    return copy;
}

std::string State::to_string() const {
    if (terminal_) {
        return "State(<terminal>)";
    }
    std::ostringstream out;
    out << "State(";
    bool first = true;
    for (const auto& kv : attributes_) {
        if (!first) out << ", ";
        out << kv.first << "=" << kv.second.to_string();
        first = false;
    }
    out << ")";
    return out.str();
}

std::size_t State::hash() const {
    std::size_t seed = terminal_ ? 1 : 0;
    for (const auto& kv : attributes_) {
        hash_combine(seed, std::hash<std::string>()(kv.first));
        hash_combine(seed, kv.second.hash());
    }
    return seed;
}

bool State::operator==(const State& other) const {
    return terminal_ == other.terminal_ && attributes_ == other.attributes_;
}

bool State::operator<(const State& other) const {
    if (terminal_ != other.terminal_) {
        return terminal_ < other.terminal_;
    }
    return attributes_ < other.attributes_;
}


/////////////////////////////////////////////////////////////
// Action
/////////////////////////////////////////////////////////////

bool Action::has_parameter(const std::string& key) const {
    return parameters_.find(key) != parameters_.end();
}

const Value& Action::get_parameter(const std::string& key) const {
    auto it = parameters_.find(key);
    if (it == parameters_.end()) {
        throw InvalidArgumentError(to_string() + " has no parameter '" + key + "'");
    }
    return it->second;
}

std::string Action::to_string() const {
    std::ostringstream out;
    out << "Action(" << name_;
    for (const auto& kv : parameters_) {
        out << ", " << kv.first << "=" << kv.second.to_string();
    }
    out << ")";
    return out.str();
}

std::size_t Action::hash() const {
    std::size_t seed = std::hash<std::string>()(name_);
    for (const auto& kv : parameters_) {
        hash_combine(seed, std::hash<std::string>()(kv.first));
        hash_combine(seed, kv.second.hash());
    }
    return seed;
}

bool Action::operator==(const Action& other) const {
    return name_ == other.name_ && parameters_ == other.parameters_;
}

bool Action::operator<(const Action& other) const {
    if (name_ != other.name_) {
        return name_ < other.name_;
    }
    return parameters_ < other.parameters_;
}

} // namespace memory_rl
