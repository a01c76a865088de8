#ifndef CORE_ERRORS_HPP
#define CORE_ERRORS_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace core {

// A task with the same id is already known and not in a replaceable state.
class DuplicateTaskError : public std::runtime_error {
 public:
  explicit DuplicateTaskError(const std::string& task_id)
      : std::runtime_error("Duplicate task " + task_id), task_id_(task_id) {}
  const std::string& TaskId() const { return task_id_; }

 private:
  std::string task_id_;
};

// Adding the task would close a cycle in the dependency graph. The cycle is
// reported starting and ending with the rejected task.
class DependencyCycleError : public std::runtime_error {
 public:
  explicit DependencyCycleError(const std::vector<std::string>& cycle)
      : std::runtime_error("Dependency cycle: " + Join(cycle)), cycle_(cycle) {}
  const std::vector<std::string>& Cycle() const { return cycle_; }

 private:
  static std::string Join(const std::vector<std::string>& cycle) {
    std::string res;
    for (const auto& id : cycle) {
      if (!res.empty()) res += " -> ";
      res += id;
    }
    return res;
  }
  std::vector<std::string> cycle_;
};

class UnknownTaskError : public std::runtime_error {
 public:
  explicit UnknownTaskError(const std::string& task_id)
      : std::runtime_error("Unknown task " + task_id) {}
};

// Raised by a StreamSource when the remote side asks us to slow down.
// retry_after is zero when the source gave no hint.
class ThrottledError : public std::runtime_error {
 public:
  explicit ThrottledError(
      const std::string& what,
      std::chrono::milliseconds retry_after = std::chrono::milliseconds(0))
      : std::runtime_error(what), retry_after_(retry_after) {}
  std::chrono::milliseconds RetryAfter() const { return retry_after_; }

 private:
  std::chrono::milliseconds retry_after_;
};

// Raised by a StreamSource for any other, possibly transient, failure.
class StreamError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace core

#endif
