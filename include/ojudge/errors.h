#ifndef INCLUDE_OJUDGE_ERRORS_H_
#define INCLUDE_OJUDGE_ERRORS_H_

#include <stdexcept>

// Bad intake input; never retried.
class ValidationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class NotFound : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Forbidden : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The sandbox (or the storage around it) could not run at all.
// Distinct from any user-code outcome; the submission ends up FAILED.
class InfrastructureFailure : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

#endif  // INCLUDE_OJUDGE_ERRORS_H_
