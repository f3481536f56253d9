#include "cffi/common.hpp"
#include "nacorr/nacorr.hpp"

#include <new>
#include <stdexcept>

using namespace nacorr;
using namespace cffi;

static CorrectionOptions selectionOrAll(const char* isotopes) {
  return isotopes == nullptr ? CorrectionOptions() : parseIsotopeSelection(isotopes);
}

static CorrectionMatrixPtr lookup(CorrectionMatrixCache* cache, const char* formula,
                                  const char* tracer, const char* isotopes) {
  auto counter = sf_parser::parseSumFormula(formula);
  auto spec = resolveTracer(counter, tracer);
  auto options = selectionOrAll(isotopes);
  if (cache == nullptr)
    return std::make_shared<const CorrectionMatrix>(buildCorrectionMatrix(counter, spec, options));
  return cache->get(counter, spec, options);
}

extern "C" {

NACORR_EXTERN CorrectionMatrixCache* nacorr_cache_new() {
  return new (std::nothrow) CorrectionMatrixCache();
}

NACORR_EXTERN void nacorr_cache_free(CorrectionMatrixCache* cache) {
  delete cache;
}

NACORR_EXTERN int nacorr_cache_size(CorrectionMatrixCache* cache) {
  return static_cast<int>(cache->size());
}

NACORR_EXTERN int nacorr_label_states(const char* formula, const char* tracer) {
  return wrap_catch<int>(-1, [&]() {
    auto counter = sf_parser::parseSumFormula(formula);
    return static_cast<int>(resolveTracer(counter, tracer).max_labels + 1);
  });
}

NACORR_EXTERN int nacorr_correction_matrix(CorrectionMatrixCache* cache,
    const char* formula, const char* tracer, const char* isotopes, double* out) {
  return wrap_catch<int>(-1, [&]() {
    auto matrix = lookup(cache, formula, tracer, isotopes);
    size_t n = matrix->size();
    for (size_t i = 0; i < n; i++)
      for (size_t j = 0; j < n; j++)
        out[i * n + j] = (*matrix)(i, j);
    return static_cast<int>(n);
  });
}

NACORR_EXTERN int nacorr_correct(CorrectionMatrixCache* cache,
    const char* formula, const char* tracer, const char* isotopes,
    int n, const double* observed,
    double* corrected, double* fractional_enrichment, double* pool_total) {
  return wrap_catch<int>(-1, [&]() {
    if (n < 0)
      throw std::invalid_argument("negative number of intensities");
    auto matrix = lookup(cache, formula, tracer, isotopes);
    IntensityVector v(observed, observed + n);
    auto result = aggregate(solveCorrection(*matrix, v).corrected);
    for (int i = 0; i < n; i++) {
      corrected[i] = result.corrected[i];
      fractional_enrichment[i] = result.fractional_enrichment[i];
    }
    *pool_total = result.pool_total;
    return 0;
  });
}
}
