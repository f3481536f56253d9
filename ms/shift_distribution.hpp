#pragma once

#include <vector>
#include <cstdlib>
#include <initializer_list>
#include <stdexcept>

namespace ms {

// Probability distribution over nominal mass shifts (in Da) relative to the
// monoisotopic molecule; probabilities[k] is the chance of +k.
struct ShiftDistribution {
  std::vector<double> probabilities;

  ShiftDistribution() : probabilities{1.0} {}
  ShiftDistribution(std::initializer_list<double> probabilities)
      : probabilities{probabilities} {}
  explicit ShiftDistribution(std::vector<double> probabilities)
      : probabilities{probabilities} {}

  // Probability of a given shift, zero beyond the stored range
  double operator[](size_t shift) const {
    return shift < probabilities.size() ? probabilities[shift] : 0.0;
  }

  // Drops everything above max_shift
  ShiftDistribution& truncated(size_t max_shift) {
    if (max_shift + 1 < size())
      probabilities.resize(max_shift + 1);
    return *this;
  }

  ShiftDistribution copyTruncated(size_t max_shift) const;

  // Convolution of two distributions, i.e. the shift distribution of the sum
  // of two independent shifts. Shifts above max_shift are discarded.
  ms::ShiftDistribution convolve(const ShiftDistribution& other, size_t max_shift) const;

  // Every step-th entry starting from zero: probabilities of shifts
  // 0, step, 2 * step, ... up to n entries
  std::vector<double> strided(size_t step, size_t n) const;

  bool isConvolutionUnit() const { return size() == 1 && probabilities[0] == 1.0; }

  double total() const;

  size_t size() const { return probabilities.size(); }
};
}
