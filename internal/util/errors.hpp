#pragma once

#include <stdexcept>
#include <string>

namespace atomicswap::util {

// Base of the coordinator's error taxonomy. grpc/grpc_error.cpp maps each
// subclass to a status code; anything else surfaces as INTERNAL.
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Malformed input. Never retried.
class Validation : public Error {
 public:
  using Error::Error;
};

class NotFound : public Error {
 public:
  using Error::Error;
};

class AlreadyExists : public Error {
 public:
  using Error::Error;
};

// Precondition violated, including a lost version race. Callers re-read the swap.
class InvalidState : public Error {
 public:
  using Error::Error;
};

// Refund attempted while the leg's timelock is still in the future.
class TimelockNotExpired : public Error {
 public:
  using Error::Error;
};

// Transient settlement failure or missed deadline.
class BackendUnavailable : public Error {
 public:
  using Error::Error;
};

// The settlement backend refused this attempt outright.
class BackendRejected : public Error {
 public:
  using Error::Error;
};

} // namespace atomicswap::util
