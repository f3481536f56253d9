#include "nacorr/workflow.hpp"
#include "nacorr/errors.hpp"
#include "nacorr/indistinguishable.hpp"
#include "ms/isocalc.hpp"

extern "C" {
#include "progressbar.h"
}

#include <cstdio>
#include <exception>
#include <mutex>

namespace nacorr {

const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::none: return "none";
    case ErrorKind::unknown_element: return "unknown element";
    case ErrorKind::invalid_formula: return "invalid formula";
    case ErrorKind::invalid_tracer_spec: return "invalid tracer";
    case ErrorKind::dimension_mismatch: return "dimension mismatch";
    case ErrorKind::singular_matrix: return "singular correction matrix";
    case ErrorKind::invalid_intensity: return "invalid intensity";
  }
  return "unknown";
}

static GroupOutcome failure(GroupOutcome outcome, ErrorKind kind, const std::exception& e) {
  outcome.error = kind;
  outcome.message = e.what();
  return outcome;
}

static void correctSeveralTracers(const MetaboliteSample& group, const ms::ElementCounter& formula,
                                  const std::vector<TracerSpec>& parsed,
                                  CorrectionMatrixCache& cache, const WorkflowSettings& settings,
                                  GroupOutcome& outcome)
{
  if (group.max_labels >= 0)
    throw InvalidTracerSpec("a label limit can't be combined with several tracers");

  auto tracers = resolveTracers(formula, parsed);
  std::vector<CorrectionOptions> options;
  if (settings.instrument) {
    for (auto& detected : detectIndistinguishableIsotopes(formula, tracers, *settings.instrument))
      options.push_back(detected.options);
  } else {
    options = selectIsotopes(tracers, settings.options, settings.tracer_options);
  }

  std::vector<CorrectionMatrixPtr> matrices;
  for (size_t k = 0; k < tracers.size(); k++)
    matrices.push_back(cache.get(formulaForTracer(formula, tracers, k), tracers[k], options[k]));

  LabelGrid grid(tracers);
  IntensityVector observed = group.observed;
  if (!group.labeled.empty()) {
    if (!observed.empty())
      throw DimensionMismatch("intensities are given both as a grid and by label state");
    observed.assign(grid.size(), 0.0);
    for (auto& item : group.labeled)
      observed[grid.index(item.first)] = item.second;
  } else if (settings.pad_to_label_range && observed.size() < grid.size()) {
    observed.resize(grid.size(), 0.0);
  }

  auto solution = solveMultiTracer(grid, matrices, observed);
  outcome.result = aggregate(solution.corrected);
  outcome.method = solution.method;
  outcome.clipped = solution.clipped;
  outcome.label_dimensions = grid.dimensions();
}

GroupOutcome correctGroup(const MetaboliteSample& group, CorrectionMatrixCache& cache,
                          const WorkflowSettings& settings)
{
  GroupOutcome outcome;
  outcome.metabolite = group.metabolite;
  outcome.sample = group.sample;
  outcome.error = ErrorKind::none;
  outcome.method = SolveMethod::exact;
  outcome.clipped = 0;

  try {
    auto formula = sf_parser::parseSumFormula(group.formula);
    auto tracers = parseTracers(group.tracer);
    if (tracers.size() > 1) {
      correctSeveralTracers(group, formula, tracers, cache, settings, outcome);
      return outcome;
    }

    auto tracer = resolveTracer(formula, tracers[0].name(), group.max_labels);

    CorrectionOptions options = settings.options;
    if (settings.instrument)
      options = detectIndistinguishableIsotopes(formula, tracer, *settings.instrument).options;

    auto matrix = cache.get(formula, tracer, options);

    IntensityVector observed = group.observed;
    if (settings.pad_to_label_range && observed.size() < matrix->size())
      observed.resize(matrix->size(), 0.0);

    auto solution = solveCorrection(*matrix, observed);
    outcome.result = aggregate(solution.corrected);
    outcome.method = solution.method;
    outcome.clipped = solution.clipped;
    outcome.label_dimensions.assign(1, matrix->size());
  } catch (ms::UnknownElement& e) {
    return failure(outcome, ErrorKind::unknown_element, e);
  } catch (sf_parser::InvalidFormula& e) {
    return failure(outcome, ErrorKind::invalid_formula, e);
  } catch (InvalidTracerSpec& e) {
    return failure(outcome, ErrorKind::invalid_tracer_spec, e);
  } catch (DimensionMismatch& e) {
    return failure(outcome, ErrorKind::dimension_mismatch, e);
  } catch (SingularCorrectionMatrix& e) {
    return failure(outcome, ErrorKind::singular_matrix, e);
  } catch (InvalidIntensity& e) {
    return failure(outcome, ErrorKind::invalid_intensity, e);
  }
  return outcome;
}

std::vector<GroupOutcome> correctAll(const std::vector<MetaboliteSample>& groups,
                                     CorrectionMatrixCache& cache,
                                     const WorkflowSettings& settings,
                                     bool use_progressbar)
{
  std::vector<GroupOutcome> outcomes(groups.size());

  progressbar* bar = nullptr;
  const size_t BAR_STEP = 10;
  if (use_progressbar)
    bar = progressbar_new("Correcting", groups.size() / BAR_STEP);

  std::mutex mutex;
  std::exception_ptr unexpected;

#pragma omp parallel for schedule(dynamic)
  for (size_t i = 0; i < groups.size(); i++) {
    try {
      outcomes[i] = correctGroup(groups[i], cache, settings);
    } catch (std::exception&) {
      // anything else (e.g. bad_alloc) must not escape the parallel region
      std::lock_guard<std::mutex> lock(mutex);
      if (!unexpected)
        unexpected = std::current_exception();
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (bar != nullptr && (i + 1) % BAR_STEP == 0)
      progressbar_inc(bar);
  }

  if (bar != nullptr) {
    progressbar_finish(bar);
    std::fflush(stdout);
  }

  if (unexpected)
    std::rethrow_exception(unexpected);
  return outcomes;
}
}
