#pragma once

#include <stdexcept>
#include <string>

#include "internal/model/stage.hpp"

namespace codereview::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class TaskNotFound : public std::runtime_error {
 public:
  explicit TaskNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  A stage collaborator failed. Carries the stage so the failure can be
  recorded on the task without parsing the message.
*/
class StageError : public std::runtime_error {
 public:
  StageError(model::Stage stage, const std::string& cause)
      : std::runtime_error(std::string(model::StageName(stage)) + ": " + cause), stage_(stage), cause_(cause) {
  }

  model::Stage Stage() const {
    return stage_;
  }

  const std::string& Cause() const {
    return cause_;
  }

 private:
  model::Stage stage_;
  std::string  cause_;
};

// Raised by transport send functions; absorbed by the broker.
class DeliveryFailure : public std::runtime_error {
 public:
  explicit DeliveryFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace codereview::util
