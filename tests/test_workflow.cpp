#include "nacorr/workflow.hpp"
#include "ms/instrument.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

static nacorr::MetaboliteSample group(const std::string& name, const std::string& formula,
                                      const nacorr::IntensityVector& observed) {
  nacorr::MetaboliteSample g;
  g.metabolite = name;
  g.sample = "S1";
  g.formula = formula;
  g.tracer = "C13";
  g.observed = observed;
  return g;
}

int main() {
  std::vector<nacorr::MetaboliteSample> groups{
    group("pyruvate", "C3H7O2", {100.0, 20.0, 5.0, 1.0}),
    group("unknown", "Xx2", {1.0, 2.0}),
    group("broken", "C3H(", {1.0}),
    group("ammonia", "NH3", {1.0, 2.0}),
    group("short", "C2H6O", {10.0, 1.0}),
    group("long", "C2H6O", {10.0, 1.0, 0.5, 0.1}),
    group("negative", "C2H6O", {10.0, -1.0, 0.5}),
    group("lactate", "C3H6O3", {1000.0, 50.0, 20.0, 5.0}),
  };

  nacorr::CorrectionMatrixCache cache;
  auto outcomes = nacorr::correctAll(groups, cache);
  if (outcomes.size() != groups.size()) {
    std::cerr << "expected one outcome per group\n";
    return 1;
  }

  nacorr::ErrorKind expected[] = {
    nacorr::ErrorKind::none,
    nacorr::ErrorKind::unknown_element,
    nacorr::ErrorKind::invalid_formula,
    nacorr::ErrorKind::invalid_tracer_spec,
    nacorr::ErrorKind::dimension_mismatch,
    nacorr::ErrorKind::dimension_mismatch,
    nacorr::ErrorKind::invalid_intensity,
    nacorr::ErrorKind::none,
  };
  for (size_t i = 0; i < groups.size(); i++) {
    if (outcomes[i].metabolite != groups[i].metabolite || outcomes[i].sample != "S1") {
      std::cerr << "outcomes are out of order\n";
      return 1;
    }
    if (outcomes[i].error != expected[i]) {
      std::cerr << groups[i].metabolite << ": got " << nacorr::toString(outcomes[i].error)
                << " (" << outcomes[i].message << ")\n";
      return 1;
    }
    if (!outcomes[i].ok() && outcomes[i].message.empty()) {
      std::cerr << groups[i].metabolite << ": missing error message\n";
      return 1;
    }
  }

  // the same formula in another sample reuses the matrix
  if (cache.size() != 3) {
    std::cerr << "expected 3 cached matrices, got " << cache.size() << "\n";
    return 1;
  }

  // missing trailing label states count as zero when padding is on
  nacorr::WorkflowSettings settings;
  settings.pad_to_label_range = true;
  auto padded = nacorr::correctGroup(groups[4], cache, settings);
  if (!padded.ok() || padded.result.corrected.size() != 3 ||
      padded.result.corrected[2] != 0.0) {
    std::cerr << "padding failed: " << padded.message << "\n";
    return 1;
  }
  auto still_long = nacorr::correctGroup(groups[5], cache, settings);
  if (still_long.error != nacorr::ErrorKind::dimension_mismatch) {
    std::cerr << "padding must not truncate longer vectors\n";
    return 1;
  }

  // a group can restrict the label range
  auto partial = groups[0];
  partial.max_labels = 1;
  partial.observed = {100.0, 20.0};
  auto restricted = nacorr::correctGroup(partial, cache);
  if (!restricted.ok() || restricted.result.corrected.size() != 2) {
    std::cerr << "max_labels ignored\n";
    return 1;
  }

  // autodetection replaces the fixed isotope selection
  nacorr::WorkflowSettings detect;
  detect.instrument = ms::makeInstrumentProfile("orbitrap", 140000.0);
  auto detected = nacorr::correctGroup(groups[0], cache, detect);
  auto fixed = outcomes[0];
  if (!detected.ok() || detected.result.corrected[0] == fixed.result.corrected[0]) {
    std::cerr << "autodetected isotopes were not used\n";
    return 1;
  }

  // 13C and 15N: each tracer is corrected with the other's label count fixed
  auto glycine = group("glycine", "C2H5NO2", {});
  glycine.tracer = "C13,N15";
  glycine.labeled[{0, 0}] = 1000.0;
  glycine.labeled[{1, 0}] = 40.0;
  glycine.labeled[{0, 1}] = 10.0;
  glycine.labeled[{2, 1}] = 200.0;
  auto dual = nacorr::correctGroup(glycine, cache);
  if (!dual.ok() || dual.label_dimensions != std::vector<size_t>({3, 2}) ||
      dual.result.corrected.size() != 6 || !(dual.result.corrected[0] > 1000.0) ||
      std::fabs(dual.result.corrected[5] - 200.0) > 1.0) {
    std::cerr << "dual tracer correction failed: " << dual.message << "\n";
    return 1;
  }
  outcomes.push_back(dual);

  auto dual_detected = nacorr::correctGroup(glycine, cache, detect);
  if (!dual_detected.ok()) {
    std::cerr << "dual tracer autodetection failed: " << dual_detected.message << "\n";
    return 1;
  }

  auto too_many = glycine;
  too_many.labeled[{3, 0}] = 1.0;
  auto with_limit = glycine;
  with_limit.max_labels = 1;
  auto absent = glycine;
  absent.tracer = "C13,S34";
  nacorr::WorkflowSettings traced_background;
  traced_background.tracer_options["N15"] = nacorr::parseIsotopeSelection("C");
  if (nacorr::correctGroup(too_many, cache).error != nacorr::ErrorKind::dimension_mismatch ||
      nacorr::correctGroup(with_limit, cache).error != nacorr::ErrorKind::invalid_tracer_spec ||
      nacorr::correctGroup(absent, cache).error != nacorr::ErrorKind::invalid_tracer_spec ||
      nacorr::correctGroup(glycine, cache, traced_background).error !=
          nacorr::ErrorKind::invalid_tracer_spec) {
    std::cerr << "invalid dual tracer groups were accepted\n";
    return 1;
  }

  for (auto& outcome : outcomes) {
    if (!outcome.ok()) continue;
    double sum = 0.0;
    for (auto fe : outcome.result.fractional_enrichment)
      sum += fe;
    if (std::fabs(sum - 1.0) > 1e-9) {
      std::cerr << outcome.metabolite << ": fractional enrichment adds up to " << sum << "\n";
      return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}
