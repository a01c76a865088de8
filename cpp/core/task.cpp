#include "core/task.hpp"

#include <algorithm>
#include <cctype>

namespace core {

const char* ToString(Priority priority) {
  switch (priority) {
    case Priority::LOW:
      return "LOW";
    case Priority::NORMAL:
      return "NORMAL";
    case Priority::HIGH:
      return "HIGH";
    case Priority::CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

const char* ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::PENDING:
      return "PENDING";
    case TaskStatus::READY:
      return "READY";
    case TaskStatus::RUNNING:
      return "RUNNING";
    case TaskStatus::DONE:
      return "DONE";
    case TaskStatus::FAILED:
      return "FAILED";
    case TaskStatus::CANCELLED:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

const char* ToString(Phase phase) {
  switch (phase) {
    case Phase::QUEUED:
      return "QUEUED";
    case Phase::ACQUIRING_SLOT:
      return "ACQUIRING_SLOT";
    case Phase::ACQUIRING_RATE:
      return "ACQUIRING_RATE";
    case Phase::TRANSFERRING:
      return "TRANSFERRING";
    case Phase::VERIFYING:
      return "VERIFYING";
    case Phase::RETRY_WAIT:
      return "RETRY_WAIT";
    case Phase::FINISHED:
      return "FINISHED";
  }
  return "UNKNOWN";
}

const char* ToString(FailureReason reason) {
  switch (reason) {
    case FailureReason::NONE:
      return "NONE";
    case FailureReason::STREAM_ERROR:
      return "STREAM_ERROR";
    case FailureReason::INTEGRITY_ERROR:
      return "INTEGRITY_ERROR";
    case FailureReason::BLOCKED_BY_DEPENDENCY:
      return "BLOCKED_BY_DEPENDENCY";
    case FailureReason::RESOURCE_UNSATISFIABLE:
      return "RESOURCE_UNSATISFIABLE";
    case FailureReason::INTERNAL_ERROR:
      return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

bool ParsePriority(const std::string& str, Priority* priority) {
  std::string upper = str;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  for (Priority p : {Priority::LOW, Priority::NORMAL, Priority::HIGH,
                     Priority::CRITICAL}) {
    if (upper == ToString(p)) {
      *priority = p;
      return true;
    }
  }
  return false;
}

}  // namespace core
