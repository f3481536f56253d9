#include "nacorr/aggregator.hpp"

#include <cmath>
#include <iostream>

int main() {
  auto result = nacorr::aggregate({60.0, 30.0, 10.0});
  if (result.pool_total != 100.0 || result.corrected.size() != 3) {
    std::cerr << "pool total is " << result.pool_total << "\n";
    return 1;
  }

  double sum = 0.0;
  for (size_t i = 0; i < result.fractional_enrichment.size(); i++) {
    double fe = result.fractional_enrichment[i];
    if (fe < 0 || fe > 1 || std::fabs(fe * result.pool_total - result.corrected[i]) > 1e-12) {
      std::cerr << "fractional enrichment out of range at " << i << "\n";
      return 1;
    }
    sum += fe;
  }
  if (std::fabs(sum - 1.0) > 1e-12) {
    std::cerr << "fractional enrichment adds up to " << sum << "\n";
    return 1;
  }

  // an empty pool is not an error
  auto empty = nacorr::aggregate({0.0, 0.0, 0.0});
  if (empty.pool_total != 0.0 || empty.fractional_enrichment.size() != 3) {
    std::cerr << "empty pool handled incorrectly\n";
    return 1;
  }
  for (auto fe : empty.fractional_enrichment) {
    if (fe != 0.0) {
      std::cerr << "fractional enrichment of an empty pool must be zero\n";
      return 1;
    }
  }

  auto single = nacorr::aggregate({42.0});
  if (single.pool_total != 42.0 || single.fractional_enrichment[0] != 1.0) {
    std::cerr << "single label state handled incorrectly\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
