#pragma once
#include <stdexcept>

namespace clio {

// Misuse of the process-wide output state lifecycle.
class OutputStateException : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

class AlreadyInitializedException : public OutputStateException {
 public:
  AlreadyInitializedException()
      : OutputStateException("clio output state is already initialised")
  {
  }
};

class AlreadyShutdownException : public OutputStateException {
 public:
  AlreadyShutdownException()
      : OutputStateException("clio output state is already shut down")
  {
  }
};

}  // namespace clio
