#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace nacorr {

// tracer missing from the formula, labeled atom count out of range and
// similar metadata inconsistencies
class InvalidTracerSpec : public std::runtime_error {
 public:
  explicit InvalidTracerSpec(const std::string& msg) : std::runtime_error(msg) {}
};

class DimensionMismatch : public std::runtime_error {
  static std::string format(size_t expected, size_t actual) {
    std::ostringstream ss;
    ss << "expected " << expected << " intensities (one per label state), got " << actual;
    return ss.str();
  }

 public:
  DimensionMismatch(size_t expected, size_t actual)
      : std::runtime_error(format(expected, actual)) {}
  explicit DimensionMismatch(const std::string& msg) : std::runtime_error(msg) {}
};

class SingularCorrectionMatrix : public std::runtime_error {
 public:
  explicit SingularCorrectionMatrix(const std::string& msg) : std::runtime_error(msg) {}
};

// negative or non-finite observed intensity
class InvalidIntensity : public std::runtime_error {
  static std::string format(size_t label, double value) {
    std::ostringstream ss;
    ss << "invalid intensity " << value << " at label state " << label;
    return ss.str();
  }

 public:
  InvalidIntensity(size_t label, double value)
      : std::runtime_error(format(label, value)) {}
};
}
