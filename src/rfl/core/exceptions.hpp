#pragma once

#include <stdexcept>
#include <string>

namespace rfl {
namespace core {


// Thrown when an estimator or solver is asked to run without enough valid data loaded.
class NotReadyException : public std::runtime_error {
 public:
  explicit NotReadyException(const std::string& msg = "Estimator is not ready")
      : std::runtime_error(msg) {}
};


// Thrown by any mutating call (or a second solve) while a solve is in progress.
class LockedException : public std::runtime_error {
 public:
  explicit LockedException(const std::string& msg = "Estimator is locked while a solve is in progress")
      : std::runtime_error(msg) {}
};


// Numerical failure inside a nonlinear fitter (non-convergence, singular system, NaN model).
class FittingException : public std::runtime_error {
 public:
  explicit FittingException(const std::string& msg) : std::runtime_error(msg) {}
};


// Numerical failure inside a trilateration solver (degenerate geometry).
class TrilaterationException : public std::runtime_error {
 public:
  explicit TrilaterationException(const std::string& msg) : std::runtime_error(msg) {}
};


// Numerical failure of a radio source estimation. Thrown with std::throw_with_nested so that the
// underlying FittingException can be recovered with std::rethrow_if_nested.
class EstimationException : public std::runtime_error {
 public:
  explicit EstimationException(const std::string& msg) : std::runtime_error(msg) {}
};


}
}
