#include "cffi/common.hpp"
#include "nacorr/matrix_cache.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

extern "C" {
nacorr::CorrectionMatrixCache* nacorr_cache_new();
void nacorr_cache_free(nacorr::CorrectionMatrixCache*);
int nacorr_cache_size(nacorr::CorrectionMatrixCache*);
int nacorr_label_states(const char* formula, const char* tracer);
int nacorr_correction_matrix(nacorr::CorrectionMatrixCache*, const char* formula,
                             const char* tracer, const char* isotopes, double* out);
int nacorr_correct(nacorr::CorrectionMatrixCache*, const char* formula, const char* tracer,
                   const char* isotopes, int n, const double* observed,
                   double* corrected, double* fractional_enrichment, double* pool_total);
}

int main() {
  auto cache = nacorr_cache_new();

  int n = nacorr_label_states("C3H7O2", "C");
  if (n != 4) {
    std::cerr << "expected 4 label states, got " << n << "\n";
    return 1;
  }

  std::vector<double> matrix(n * n);
  if (nacorr_correction_matrix(cache, "C3H7O2", "C", nullptr, matrix.data()) != n ||
      matrix[n * n - 1] != 1.0 || nacorr_cache_size(cache) != 1) {
    std::cerr << "correction matrix not returned\n";
    return 1;
  }

  std::vector<double> observed{100.0, 20.0, 5.0, 1.0}, corrected(n), enrichment(n);
  double pool = 0.0;
  if (nacorr_correct(cache, "C3H7O2", "C", nullptr, n, observed.data(),
                     corrected.data(), enrichment.data(), &pool) != 0 ||
      std::fabs(pool - 126.0) > 1e-9 || nacorr_cache_size(cache) != 1) {
    std::cerr << "correction failed: " << nacorr_strerror() << "\n";
    return 1;
  }

  // works without a cache as well
  std::vector<double> uncached(n);
  if (nacorr_correct(nullptr, "C3H7O2", "C", "*", n, observed.data(),
                     uncached.data(), enrichment.data(), &pool) != 0 ||
      uncached != corrected) {
    std::cerr << "uncached correction differs\n";
    return 1;
  }

  if (nacorr_correct(cache, "Xx2", "C", nullptr, n, observed.data(),
                     corrected.data(), enrichment.data(), &pool) != -1 ||
      std::string(nacorr_strerror()).find("Xx") == std::string::npos) {
    std::cerr << "unknown element not reported\n";
    return 1;
  }

  if (nacorr_correct(cache, "C3H7O2", "C", nullptr, 2, observed.data(),
                     corrected.data(), enrichment.data(), &pool) != -1 ||
      std::string(nacorr_strerror()).find("expected 4") == std::string::npos) {
    std::cerr << "dimension mismatch not reported\n";
    return 1;
  }

  if (nacorr_correction_matrix(cache, "C3H7O2", "C", "C13", matrix.data()) != -1 ||
      nacorr_label_states("NH3", "C13") != -1) {
    std::cerr << "invalid tracer not reported\n";
    return 1;
  }

  nacorr_cache_free(cache);
  std::cout << "OK\n";
  return 0;
}
