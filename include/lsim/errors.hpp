#pragma once
#include <stdexcept>
#include <string>

namespace lsim {

// Malformed world tree (cycle, dangling parent, inconsistent children).
// Fatal: a tick that raises this is never committed.
class StructuralError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Lookup of an id that is not part of the tree / state.
class UnknownNode : public std::out_of_range {
public:
  explicit UnknownNode(const std::string& id) : std::out_of_range("unknown node: " + id) {}
};

class ConfigError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Replay log written with a different schema version (or unreadable line).
class ReplayMismatch : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Decision policy failure or timeout, only raised when the scheduler is told
// to halt on policy errors instead of substituting IDLE.
class PolicyError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Raised by step() after a fatal error halted the run.
class KernelHalted : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace lsim
