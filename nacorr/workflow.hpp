#pragma once

#include "nacorr/aggregator.hpp"
#include "nacorr/matrix_cache.hpp"
#include "nacorr/solver.hpp"
#include "nacorr/multi_tracer.hpp"
#include "ms/instrument.hpp"

#include <map>
#include <string>
#include <vector>

namespace nacorr {

// observed intensities of one metabolite in one sample
struct MetaboliteSample {
  std::string metabolite;
  std::string sample;
  std::string formula;
  std::string tracer;        // "C13", or several tracers: "C13,N15"
  IntensityVector observed;  // index = number of labeled atoms
  int max_labels;            // < 0: number of tracer atoms in the formula

  // Several tracers: label counts in tracer order -> intensity, absent states
  // are zero. When empty, observed holds the whole LabelGrid instead.
  std::map<std::vector<unsigned>, double> labeled;

  MetaboliteSample() : max_labels(-1) {}
};

enum class ErrorKind {
  none,
  unknown_element,
  invalid_formula,
  invalid_tracer_spec,
  dimension_mismatch,
  singular_matrix,
  invalid_intensity
};

const char* toString(ErrorKind kind);

struct GroupOutcome {
  std::string metabolite;
  std::string sample;
  ErrorKind error;
  std::string message;
  CorrectionResult result;  // empty unless error == ErrorKind::none
  SolveMethod method;
  size_t clipped;
  std::vector<size_t> label_dimensions;  // LabelGrid of result.corrected

  bool ok() const { return error == ErrorKind::none; }
};

struct WorkflowSettings {
  // fixed isotope selection, used when no instrument is given
  CorrectionOptions options;

  // when set, indistinguishable isotopes are detected per formula
  ms::InstrumentProfilePtr instrument;

  // Selections of groups with several tracers, keyed by tracer name; see
  // selectIsotopes. options applies to the first tracer.
  std::map<std::string, CorrectionOptions> tracer_options;

  // fill missing trailing label states with zeros
  bool pad_to_label_range;

  WorkflowSettings() : pad_to_label_range(false) {}
};

// Corrects a single group; failures are reported in the outcome, not thrown.
GroupOutcome correctGroup(const MetaboliteSample& group, CorrectionMatrixCache& cache,
                          const WorkflowSettings& settings=WorkflowSettings());

// Corrects all groups in parallel. Outcomes are in the input order.
std::vector<GroupOutcome> correctAll(const std::vector<MetaboliteSample>& groups,
                                     CorrectionMatrixCache& cache,
                                     const WorkflowSettings& settings=WorkflowSettings(),
                                     bool use_progressbar=false);
}
