#pragma once

#include "nacorr/correction_matrix.hpp"

#include <vector>

namespace nacorr {

struct CorrectionResult {
  IntensityVector corrected;
  double pool_total;
  std::vector<double> fractional_enrichment;
};

// Pool total is the plain sum of corrected intensities; fractional enrichment
// is the corrected vector divided by it, or all zeros when the pool is empty.
CorrectionResult aggregate(const IntensityVector& corrected);
}
