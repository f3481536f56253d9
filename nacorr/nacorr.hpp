#pragma once

#include "nacorr/errors.hpp"
#include "nacorr/tracer.hpp"
#include "nacorr/correction_matrix.hpp"
#include "nacorr/solver.hpp"
#include "nacorr/aggregator.hpp"
#include "nacorr/matrix_cache.hpp"
#include "nacorr/indistinguishable.hpp"
#include "nacorr/multi_tracer.hpp"
#include "nacorr/workflow.hpp"

#include <string>

namespace nacorr {

// parse -> matrix (through the cache) -> solve -> aggregate; errors are thrown
inline CorrectionResult correct(const std::string& formula, const std::string& tracer,
                                const IntensityVector& observed,
                                CorrectionMatrixCache& cache,
                                const CorrectionOptions& options=CorrectionOptions()) {
  auto counter = sf_parser::parseSumFormula(formula);
  auto spec = resolveTracer(counter, tracer);
  auto matrix = cache.get(counter, spec, options);
  return aggregate(solveCorrection(*matrix, observed).corrected);
}
}
