#include "nacorr/multi_tracer.hpp"
#include "nacorr/matrix_cache.hpp"
#include "nacorr/errors.hpp"
#include "ms/periodic_table.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

// expected observation of a true label distribution, tracer by tracer
static nacorr::IntensityVector forwardGrid(const nacorr::LabelGrid& grid,
                                           const std::vector<nacorr::CorrectionMatrixPtr>& m,
                                           nacorr::IntensityVector x) {
  for (size_t axis = 0; axis < grid.rank(); axis++) {
    size_t n = grid.dimensions()[axis], stride = grid.stride(axis);
    for (size_t start = 0; start < grid.size(); start++) {
      if ((start / stride) % n != 0) continue;
      nacorr::IntensityVector line(n);
      for (size_t j = 0; j < n; j++) line[j] = x[start + j * stride];
      auto v = m[axis]->forward(line);
      for (size_t j = 0; j < n; j++) x[start + j * stride] = v[j];
    }
  }
  return x;
}

int main() {
  auto glycine = sf_parser::parseSumFormula("C2H5NO2");
  auto tracers = nacorr::resolveTracers(glycine, nacorr::parseTracers("C13, N15"));
  if (tracers.size() != 2 || tracers[0].max_labels != 2 || tracers[1].max_labels != 1) {
    std::cerr << "tracers resolved incorrectly\n";
    return 1;
  }

  nacorr::LabelGrid grid(tracers);
  std::vector<unsigned> c2n1{2, 1};
  if (grid.size() != 6 || grid.stride(0) != 2 || grid.index(c2n1) != 5 ||
      grid.counts(3) != std::vector<unsigned>({1, 1})) {
    std::cerr << "label grid layout is wrong\n";
    return 1;
  }
  try {
    grid.index({3, 0});
    std::cerr << "Expected DimensionMismatch for 3 carbon labels\n";
    return 1;
  } catch (nacorr::DimensionMismatch&) {
  }

  const char* twice[] = {"C13,C", "", " , "};
  for (auto t : twice) {
    try {
      nacorr::parseTracers(t);
      std::cerr << "Expected InvalidTracerSpec for '" << t << "'\n";
      return 1;
    } catch (nacorr::InvalidTracerSpec&) {
    }
  }

  auto for_nitrogen = nacorr::formulaForTracer(glycine, tracers, 1);
  if (for_nitrogen.count("C") || for_nitrogen.at("N") != 1 || for_nitrogen.at("O") != 2) {
    std::cerr << "carbon must be left out of the nitrogen pass\n";
    return 1;
  }

  // the background goes with the first tracer only
  auto options = nacorr::selectIsotopes(tracers, nacorr::CorrectionOptions(), {});
  if (!options[0].all_isotopes || options[1].all_isotopes || !options[1].isotopes.empty()) {
    std::cerr << "background isotopes are corrected twice\n";
    return 1;
  }

  auto selections = nacorr::parseTracerSelections("H,O17:2; N=H");
  if (selections.size() != 2 || selections.at("").key() != "H,O17:2" ||
      selections.at("N15").key() != "H") {
    std::cerr << "per tracer selections parsed incorrectly\n";
    return 1;
  }
  try {
    nacorr::selectIsotopes(tracers, nacorr::parseIsotopeSelection("N,H"), {});
    std::cerr << "Expected InvalidTracerSpec for a traced element in the selection\n";
    return 1;
  } catch (nacorr::InvalidTracerSpec&) {
  }
  try {
    nacorr::parseTracerSelections("C13=H;C=O");
    std::cerr << "Expected failure for a repeated tracer\n";
    return 1;
  } catch (std::invalid_argument&) {
  }

  nacorr::CorrectionMatrixCache cache;
  std::vector<nacorr::CorrectionMatrixPtr> matrices;
  for (size_t k = 0; k < tracers.size(); k++)
    matrices.push_back(cache.get(nacorr::formulaForTracer(glycine, tracers, k), tracers[k],
                                 options[k]));

  // a single nitrogen on its own: row 0 is just its abundances
  const auto& n = ms::Element::getByName("N");
  if (cache.size() != 2 || matrices[1]->size() != 2 ||
      std::fabs((*matrices[1])(0, 1) - n.isotopes[1].abundance) > 1e-12) {
    std::cerr << "nitrogen matrix is wrong\n";
    return 1;
  }

  nacorr::IntensityVector truth{500.0, 0.0, 100.0, 0.0, 0.0, 300.0};
  auto observed = forwardGrid(grid, matrices, truth);
  auto solution = nacorr::solveMultiTracer(grid, matrices, observed);
  if (solution.method != nacorr::SolveMethod::exact) {
    std::cerr << "expected an exact solution\n";
    return 1;
  }
  for (size_t i = 0; i < truth.size(); i++) {
    if (std::fabs(solution.corrected[i] - truth[i]) > 1e-9 * 500.0) {
      std::cerr << "state " << i << " corrected to " << solution.corrected[i]
                << ", expected " << truth[i] << "\n";
      return 1;
    }
  }

  // no 13C2 and too little 15N for the parent's own natural isotopes
  nacorr::IntensityVector noisy{1000.0, 1.0, 30.0, 0.0, 0.0, 0.0};
  auto clipped = nacorr::solveMultiTracer(grid, matrices, noisy);
  if (clipped.method != nacorr::SolveMethod::nnls || clipped.corrected[0] < 1000.0) {
    std::cerr << "negative states were not handled\n";
    return 1;
  }

  try {
    nacorr::solveMultiTracer(grid, matrices, {1.0, 2.0});
    std::cerr << "Expected DimensionMismatch\n";
    return 1;
  } catch (nacorr::DimensionMismatch&) {
  }

  std::cout << "OK\n";
  return 0;
}
