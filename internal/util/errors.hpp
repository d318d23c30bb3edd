#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace jobflow::util {

/*
  Central error types.

  NotFound and InvariantViolation are raised before anything enters the
  pending stage. CommitFailure is raised by CommitAll after every group that
  could still be applied has been applied.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvariantViolation : public std::runtime_error {
 public:
  explicit InvariantViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CommitFailure : public std::runtime_error {
 public:
  CommitFailure(std::string resources, std::string step, const std::string& cause)
      : std::runtime_error("commit failed for resources [" + resources + "] at step " + step + ": " + cause),
        resources_(std::move(resources)),
        step_(std::move(step)) {
  }

  const std::string& resources() const {
    return resources_;
  }
  const std::string& step() const {
    return step_;
  }

 private:
  std::string resources_;
  std::string step_;
};

inline std::string MissingEntity(const std::string& kind, uint64_t id) {
  return kind + " " + std::to_string(id) + " does not exist";
}

} // namespace jobflow::util
