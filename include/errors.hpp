// ============================================================================
// errors.hpp -- Exception types raised by the movie generator
//
// Every failure of a generation call surfaces as one of these exceptions on
// the calling thread. Nothing is returned from a failed call.
// ============================================================================
#pragma once
#include <stdexcept>
#include <string>

namespace simcad {

// ============================================================================
// `InvalidParameter`
// A configuration value is outside its admissible range.
// ============================================================================
class InvalidParameter : public std::invalid_argument {
public:
  explicit InvalidParameter(const std::string& what)
  : std::invalid_argument(what) {}
};

// ============================================================================
// `GenerationExhausted`
// Spike-train rejection sampling ran out of attempts for a cell.
// ============================================================================
class GenerationExhausted : public std::runtime_error {
public:
  GenerationExhausted(const std::string& what, int attempts)
  : std::runtime_error(what), attempts_{attempts} {}

  [[nodiscard]] int attempts() const noexcept { return attempts_; }

private:
  int attempts_;
};

} // namespace simcad
