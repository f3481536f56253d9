#include "nacorr/aggregator.hpp"

#include <numeric>

namespace nacorr {

CorrectionResult aggregate(const IntensityVector& corrected) {
  CorrectionResult result;
  result.corrected = corrected;
  result.pool_total = std::accumulate(corrected.begin(), corrected.end(), 0.0);
  result.fractional_enrichment.assign(corrected.size(), 0.0);
  if (result.pool_total != 0.0)
    for (size_t i = 0; i < corrected.size(); i++)
      result.fractional_enrichment[i] = corrected[i] / result.pool_total;
  return result;
}
}
