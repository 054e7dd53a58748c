/************************************************************
 * PythonEnv.cpp
 *
 * Implementation of the Python environment bridge.
 ************************************************************/

#include "PythonEnv.hpp"
#include "Errors.hpp"

#include <pybind11/embed.h>

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <utility>

namespace memory_rl {

namespace {

// Log a collaborator failure and rethrow it as ExternalLookupError
[[noreturn]] void raise_external(const std::string& name, const std::string& where,
                                 const std::exception& e) {
    std::cerr << "[PythonEnv] " << name << " " << where << " error: " << e.what() << std::endl;
    throw ExternalLookupError(name + " " + where + ": " + e.what());
}

} // namespace


/////////////////////////////////////////////////////////////
// Constructor / Destructor
/////////////////////////////////////////////////////////////

PythonEnv::PythonEnv(const PythonEnvConfig& config)
    : name_(config.module_name + "." + config.class_name)
{
    initialize_python(config.python_path);
    try {
        py::module_ module = py::module_::import(config.module_name.c_str());
        env_ = module.attr(config.class_name.c_str())();
    } catch (py::error_already_set& e) {
        raise_external(name_, "construction", e);
    }

    std::cout << "[PythonEnv] Initialized " << name_ << std::endl;
}

PythonEnv::PythonEnv(py::object env, const std::string& name)
    : env_(std::move(env))
    , name_(name)
{
    if (!env_ || env_.is_none()) {
        throw InvalidArgumentError("PythonEnv requires a Python environment object");
    }
    initialize_python("");

    std::cout << "[PythonEnv] Wrapped " << name_ << std::endl;
}

PythonEnv::~PythonEnv() {
    cleanup_python();
}


/////////////////////////////////////////////////////////////
// Python Interpreter Management
/////////////////////////////////////////////////////////////

void PythonEnv::initialize_python(const std::string& python_path) {
    if (!Py_IsInitialized()) {
        // Never finalized: extension modules do not survive re-initialization
        py::initialize_interpreter();
        std::cout << "[PythonEnv] Python interpreter initialized" << std::endl;
    }

    std::string path_entry = python_path;
    if (path_entry.empty()) {
        const char* env_path = std::getenv("MEMORY_RL_PYTHON_PATH");
        if (env_path) {
            path_entry = env_path;
        }
    }

    if (!path_entry.empty()) {
        try {
            py::module_ sys = py::module_::import("sys");
            sys.attr("path").attr("append")(path_entry);
            std::cout << "[PythonEnv] Using Python path: " << path_entry << std::endl;
        } catch (py::error_already_set& e) {
            raise_external("PythonEnv", "sys.path setup", e);
        }
    }
}

void PythonEnv::cleanup_python() {
    // Drop our reference while the interpreter is still alive
    env_ = py::object();
}


/////////////////////////////////////////////////////////////
// IEnv Interface Implementation
/////////////////////////////////////////////////////////////

void PythonEnv::start_new_episode() {
    try {
        env_.attr("start_new_episode")();
    } catch (py::error_already_set& e) {
        raise_external(name_, "start_new_episode", e);
    }
}

State PythonEnv::get_observation() const {
    try {
        return to_state(env_.attr("get_observation")());
    } catch (py::error_already_set& e) {
        raise_external(name_, "get_observation", e);
    } catch (py::cast_error& e) {
        raise_external(name_, "get_observation", e);
    }
}

ActionList PythonEnv::get_actions() const {
    if (end_of_episode()) {
        return {};
    }
    try {
        ActionList actions;
        for (py::handle item : env_.attr("get_actions")()) {
            actions.push_back(to_action(item));
        }
        return actions;
    } catch (py::error_already_set& e) {
        raise_external(name_, "get_actions", e);
    } catch (py::cast_error& e) {
        raise_external(name_, "get_actions", e);
    }
}

double PythonEnv::react(const Action& action) {
    if (end_of_episode()) {
        throw InvalidStateError("PythonEnv::react called after the episode ended");
    }
    try {
        return env_.attr("react")(from_action(action)).cast<double>();
    } catch (py::error_already_set& e) {
        raise_external(name_, "react", e);
    } catch (py::cast_error& e) {
        raise_external(name_, "react", e);
    }
}

bool PythonEnv::end_of_episode() const {
    try {
        return env_.attr("end_of_episode")().cast<bool>();
    } catch (py::error_already_set& e) {
        raise_external(name_, "end_of_episode", e);
    } catch (py::cast_error& e) {
        raise_external(name_, "end_of_episode", e);
    }
}

State PythonEnv::get_state() const {
    if (!py::hasattr(env_, "get_state")) {
        return get_observation();
    }
    try {
        return to_state(env_.attr("get_state")());
    } catch (py::error_already_set& e) {
        raise_external(name_, "get_state", e);
    } catch (py::cast_error& e) {
        raise_external(name_, "get_state", e);
    }
}

std::string PythonEnv::get_name() const {
    return "PythonEnv-" + name_;
}


/////////////////////////////////////////////////////////////
// Conversion Utilities
/////////////////////////////////////////////////////////////

Value PythonEnv::to_value(const py::handle& obj) {
    if (obj.is_none()) {
        return Value::null();
    }
    // bool before int: Python bools are ints
    if (py::isinstance<py::bool_>(obj)) {
        return Value(obj.cast<bool>() ? 1 : 0);
    }
    if (py::isinstance<py::int_>(obj)) {
        return Value(static_cast<double>(obj.cast<long long>()));
    }
    if (py::isinstance<py::float_>(obj)) {
        return Value(obj.cast<double>());
    }
    if (py::isinstance<py::str>(obj)) {
        return Value(obj.cast<std::string>());
    }
    throw py::cast_error("unsupported attribute value of type "
                         + py::str(py::type::handle_of(obj)).cast<std::string>());
}

State PythonEnv::to_state(const py::handle& obj) {
    if (obj.is_none()) {
        return State::terminal();
    }
    State::Attributes attributes;
    for (auto item : obj.cast<py::dict>()) {
        attributes[item.first.cast<std::string>()] = to_value(item.second);
    }
    return State(attributes);
}

Action PythonEnv::to_action(const py::handle& obj) {
    if (py::isinstance<py::str>(obj)) {
        return Action(obj.cast<std::string>());
    }
    py::tuple pair = obj.cast<py::tuple>();
    if (pair.size() != 2) {
        throw py::cast_error("action must be a name or a (name, parameters) pair");
    }
    Action::Parameters parameters;
    for (auto item : pair[1].cast<py::dict>()) {
        parameters[item.first.cast<std::string>()] = to_value(item.second);
    }
    return Action(pair[0].cast<std::string>(), parameters);
}

py::object PythonEnv::from_action(const Action& action) {
    if (action.parameters().empty()) {
        return py::str(action.name());
    }
    py::dict parameters;
    for (const auto& kv : action.parameters()) {
        const Value& value = kv.second;
        py::object converted;
        switch (value.kind()) {
        case Value::Kind::Null:
            converted = py::none();
            break;
        case Value::Kind::Number: {
            double number = value.as_number();
            double integral = 0.0;
            if (std::modf(number, &integral) == 0.0) {
                converted = py::int_(static_cast<long long>(number));
            } else {
                converted = py::float_(number);
            }
            break;
        }
        case Value::Kind::String:
            converted = py::str(value.as_string());
            break;
        }
        parameters[py::str(kv.first)] = converted;
    }
    return py::make_tuple(action.name(), parameters);
}

} // namespace memory_rl
