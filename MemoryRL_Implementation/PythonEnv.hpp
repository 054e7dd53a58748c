/************************************************************
 * PythonEnv.hpp
 *
 * Bridge for environments implemented in Python (e.g. ones that
 * pull their content from a knowledge base). Lets the C++ agents
 * and the GatingMemory decorator run on them unchanged.
 *
 * The Python object must provide:
 *   start_new_episode(), get_observation(), get_actions(),
 *   react(action), end_of_episode()
 * and may provide get_state().
 ************************************************************/

#ifndef PYTHON_ENV_HPP
#define PYTHON_ENV_HPP

#include "IEnv.hpp"

#include <pybind11/pybind11.h>

#include <string>

namespace py = pybind11;

namespace memory_rl {

// CONFIGURATION
struct PythonEnvConfig {
    std::string module_name;     // Module to import
    std::string class_name;      // Environment class, constructed with no arguments
    std::string python_path;     // Extra sys.path entry; MEMORY_RL_PYTHON_PATH if empty
};


/**
 * PythonEnv
 *
 * Conversions:
 * - Observation: dict of str -> None/int/float/str; None means terminal
 * - Action: str name, or (name, dict) when it has parameters
 *
 * Every Python exception is logged and rethrown as
 * ExternalLookupError, never treated as an empty result.
 */
class PythonEnv : public IEnv {
public:
    // Import config.module_name and instantiate config.class_name
    explicit PythonEnv(const PythonEnvConfig& config);

    // Wrap an existing Python environment object
    PythonEnv(py::object env, const std::string& name);

    ~PythonEnv() override;

    // Disable copy (Python objects can't be trivially copied)
    PythonEnv(const PythonEnv&) = delete;
    PythonEnv& operator=(const PythonEnv&) = delete;

// IEnv Interface Implementation
    void start_new_episode() override;
    State get_observation() const override;
    ActionList get_actions() const override;
    double react(const Action& action) override;
    bool end_of_episode() const override;
    State get_state() const override;
    std::string get_name() const override;

// Conversion Utilities
    static Value to_value(const py::handle& obj);
    static State to_state(const py::handle& obj);
    static Action to_action(const py::handle& obj);
    static py::object from_action(const Action& action);

private:
// Python Bridge Management
    void initialize_python(const std::string& python_path);
    void cleanup_python();

    py::object env_;
    std::string name_;
};

} // namespace memory_rl

#endif // PYTHON_ENV_HPP
