// === Error Taxonomy ==========================================================
//
// Exception types raised inside the relay. Only the command router and the
// broadcast loops catch them; callers of CommandRouter::execute always receive
// a structured CommandResult instead.

#pragma once

#include <stdexcept>
#include <string>

namespace drone_relay {

/** @brief Root of every relay-specific exception. */
class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Command parameters are malformed or out of range. */
class ValidationError final : public Error {
  public:
    using Error::Error;
};

/** @brief Command is well formed but illegal for the current vehicle state. */
class PreconditionError final : public Error {
  public:
    using Error::Error;
};

/** @brief Hardware adapter lost its device and switched to synthetic data. */
class HardwareDegradedError final : public Error {
  public:
    using Error::Error;
};

/** @brief A message could not be delivered to one client. */
class DeliveryError final : public Error {
  public:
    using Error::Error;
};

}  // namespace drone_relay
