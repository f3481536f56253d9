#include "nacorr/nacorr.hpp"

#include <cmath>
#include <iostream>

// C3H7O2 labeled with 13C, observed M0..M3 = 100, 20, 5, 1; every natural
// isotope of H and O is taken into account.
int main() {
  nacorr::CorrectionMatrixCache cache;
  auto result = nacorr::correct("C3H7O2", "C", {100.0, 20.0, 5.0, 1.0}, cache);

  // Derived from the row-stochastic model: M0 rises above 100 and the pool
  // equals the raw sum. Don't adjust these towards "M0 below 100".
  const double expected[] = {
    103.86670163077424, 17.054389293295536, 4.2152159116440178, 0.86369316428619725
  };
  if (result.corrected.size() != 4) {
    std::cerr << "expected 4 label states\n";
    return 1;
  }
  for (size_t i = 0; i < 4; i++) {
    if (std::fabs(result.corrected[i] - expected[i]) > 1e-6 * expected[i]) {
      std::cerr << "M" << i << " corrected to " << result.corrected[i]
                << ", expected " << expected[i] << "\n";
      return 1;
    }
  }

  // rows of M add up to one, so nothing is lost or created
  if (std::fabs(result.pool_total - 126.0) > 1e-9) {
    std::cerr << "pool total is " << result.pool_total << "\n";
    return 1;
  }
  if (std::fabs(result.fractional_enrichment[0] - 0.82433890183154157) > 1e-8) {
    std::cerr << "unexpected M0 enrichment " << result.fractional_enrichment[0] << "\n";
    return 1;
  }

  // the corrected label distribution is shifted towards lighter states
  if (!(result.corrected[0] > 100.0 && result.corrected[1] < 20.0 &&
        result.corrected[2] < 5.0 && result.corrected[3] < 1.0)) {
    std::cerr << "correction went the wrong way\n";
    return 1;
  }

  try {
    nacorr::correct("Xx2", "C", {1.0}, cache);
    std::cerr << "Expected UnknownElement for Xx2\n";
    return 1;
  } catch (ms::UnknownElement&) {
  } catch (std::exception& e) {
    std::cerr << "Xx2 raised the wrong error: " << e.what() << "\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
