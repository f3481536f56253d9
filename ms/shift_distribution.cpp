#include "ms/shift_distribution.hpp"

#include <algorithm>

namespace ms {

double ShiftDistribution::total() const {
  double sum = 0.0;
  for (auto p : probabilities)
    sum += p;
  return sum;
}

ShiftDistribution ShiftDistribution::convolve(
    const ShiftDistribution& other, size_t max_shift) const {
  if (this->isConvolutionUnit()) return other.copyTruncated(max_shift);
  if (other.isConvolutionUnit()) return this->copyTruncated(max_shift);

  size_t n1 = std::min(size(), max_shift + 1);
  size_t n2 = std::min(other.size(), max_shift + 1);
  size_t n = std::min(n1 + n2 - 1, max_shift + 1);

  ShiftDistribution result{std::vector<double>(n, 0.0)};
  for (size_t i = 0; i < n1; i++) {
    if (probabilities[i] == 0.0) continue;
    for (size_t j = 0; j < n2 && i + j < n; j++)
      result.probabilities[i + j] += probabilities[i] * other.probabilities[j];
  }
  return result;
}

ShiftDistribution ShiftDistribution::copyTruncated(size_t max_shift) const {
  ShiftDistribution p{probabilities};
  return p.truncated(max_shift);
}

std::vector<double> ShiftDistribution::strided(size_t step, size_t n) const {
  if (step == 0)
    throw std::invalid_argument("stride must be positive");
  std::vector<double> result(n);
  for (size_t k = 0; k < n; k++)
    result[k] = (*this)[k * step];
  return result;
}
}
