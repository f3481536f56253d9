#include "nacorr/multi_tracer.hpp"
#include "nacorr/errors.hpp"
#include "ms/periodic_table.hpp"
#include "utils/string.hpp"

#include <sstream>
#include <stdexcept>

namespace nacorr {

LabelGrid::LabelGrid(const std::vector<TracerSpec>& tracers) {
  for (auto& tracer : tracers)
    dims_.push_back(tracer.max_labels + 1);
}

LabelGrid::LabelGrid(const std::vector<size_t>& dimensions) : dims_(dimensions) {
  for (auto d : dims_)
    if (d == 0)
      throw std::invalid_argument("label grid dimensions must be positive");
}

size_t LabelGrid::size() const {
  size_t n = 1;
  for (auto d : dims_)
    n *= d;
  return n;
}

size_t LabelGrid::stride(size_t axis) const {
  size_t s = 1;
  for (size_t k = axis + 1; k < dims_.size(); k++)
    s *= dims_[k];
  return s;
}

size_t LabelGrid::index(const std::vector<unsigned>& counts) const {
  if (counts.size() != dims_.size())
    throw DimensionMismatch(dims_.size(), counts.size());
  size_t result = 0;
  for (size_t k = 0; k < dims_.size(); k++) {
    if (counts[k] >= dims_[k]) {
      std::ostringstream ss;
      ss << "label count " << counts[k] << " of tracer " << k + 1
         << " is out of range 0.." << dims_[k] - 1;
      throw DimensionMismatch(ss.str());
    }
    result = result * dims_[k] + counts[k];
  }
  return result;
}

std::vector<unsigned> LabelGrid::counts(size_t index) const {
  std::vector<unsigned> result(dims_.size());
  for (size_t k = dims_.size(); k > 0; k--) {
    result[k - 1] = static_cast<unsigned>(index % dims_[k - 1]);
    index /= dims_[k - 1];
  }
  return result;
}

std::vector<TracerSpec> resolveTracers(const ms::ElementCounter& formula,
                                       const std::vector<TracerSpec>& tracers) {
  std::vector<TracerSpec> result;
  for (auto tracer : tracers) {
    tracer.max_labels = tracerAtomCount(formula, tracer);
    validateTracer(formula, tracer);
    result.push_back(tracer);
  }
  return result;
}

ms::ElementCounter formulaForTracer(const ms::ElementCounter& formula,
                                    const std::vector<TracerSpec>& tracers, size_t axis) {
  ms::ElementCounter result = formula;
  for (size_t k = 0; k < tracers.size(); k++)
    if (k != axis)
      result.erase(tracers[k].element);
  return result;
}

static bool isTracerElement(const std::string& element, const std::vector<TracerSpec>& tracers) {
  for (auto& tracer : tracers)
    if (tracer.element == element)
      return true;
  return false;
}

std::vector<CorrectionOptions> selectIsotopes(const std::vector<TracerSpec>& tracers,
                                              const CorrectionOptions& first_tracer,
                                              const std::map<std::string, CorrectionOptions>& per_tracer)
{
  std::vector<CorrectionOptions> result;
  for (size_t k = 0; k < tracers.size(); k++) {
    auto it = per_tracer.find(tracers[k].name());
    CorrectionOptions options;
    if (it != per_tracer.end())
      options = it->second;
    else if (k == 0)
      options = first_tracer;
    else
      options = CorrectionOptions::selection(IsotopeLimits());

    if (!options.all_isotopes) {
      for (auto& item : options.isotopes) {
        auto element = ms::parseIsotopeName(item.first).first;
        if (isTracerElement(element, tracers))
          throw InvalidTracerSpec("tracer element " + element +
                                  " can't be an indistinguishable element");
      }
    }
    result.push_back(options);
  }
  return result;
}

std::vector<IndistinguishableIsotopes> detectIndistinguishableIsotopes(
    const ms::ElementCounter& formula, const std::vector<TracerSpec>& tracers,
    const ms::InstrumentProfile& instrument)
{
  std::vector<IndistinguishableIsotopes> result;
  std::map<std::string, std::pair<double, size_t>> owner;

  for (size_t k = 0; k < tracers.size(); k++) {
    auto detected = detectIndistinguishableIsotopes(formula, tracers[k], instrument);

    IndistinguishableIsotopes kept;
    for (auto& r : detected.isotopes) {
      if (isTracerElement(ms::parseIsotopeName(r.isotope).first, tracers))
        continue;
      kept.isotopes.push_back(r);
      if (r.limit == 0)
        continue;
      auto it = owner.find(r.isotope);
      if (it == owner.end() || r.mass_defect < it->second.first)
        owner[r.isotope] = std::make_pair(r.mass_defect, k);
    }
    result.push_back(kept);
  }

  for (size_t k = 0; k < result.size(); k++) {
    IsotopeLimits selected;
    for (auto& r : result[k].isotopes)
      if (r.limit > 0 && owner[r.isotope].second == k)
        selected[r.isotope] = r.limit;
    result[k].options = CorrectionOptions::selection(selected);
  }
  return result;
}

std::map<std::string, CorrectionOptions> parseTracerSelections(const std::string& text) {
  std::map<std::string, CorrectionOptions> result;
  for (auto& entry : utils::split(text, ';')) {
    auto item = utils::trim(entry);
    if (item.empty())
      continue;

    std::string tracer;
    auto eq = item.find('=');
    if (eq != std::string::npos) {
      tracer = parseTracer(utils::trim(item.substr(0, eq))).name();
      item = item.substr(eq + 1);
    }
    if (result.count(tracer))
      throw std::invalid_argument("isotopes for " + (tracer.empty() ? "the first tracer" : tracer) +
                                  " are given twice");
    result[tracer] = parseIsotopeSelection(item);
  }
  return result;
}

Solution solveMultiTracer(const LabelGrid& grid,
                          const std::vector<CorrectionMatrixPtr>& matrices,
                          const IntensityVector& observed)
{
  if (matrices.size() != grid.rank())
    throw std::invalid_argument("one correction matrix per tracer is required");
  if (observed.size() != grid.size())
    throw DimensionMismatch(grid.size(), observed.size());
  for (size_t k = 0; k < matrices.size(); k++) {
    if (!matrices[k])
      throw std::invalid_argument("missing correction matrix");
    if (matrices[k]->size() != grid.dimensions()[k])
      throw DimensionMismatch(grid.dimensions()[k], matrices[k]->size());
  }

  Solution solution;
  solution.corrected = observed;
  solution.method = SolveMethod::exact;
  solution.clipped = 0;

  for (size_t axis = 0; axis < grid.rank(); axis++) {
    const size_t n = grid.dimensions()[axis];
    const size_t stride = grid.stride(axis);
    IntensityVector line(n);
    for (size_t start = 0; start < grid.size(); start++) {
      if ((start / stride) % n != 0)
        continue;

      for (size_t j = 0; j < n; j++)
        line[j] = solution.corrected[start + j * stride];
      auto s = solveCorrection(*matrices[axis], line);
      for (size_t j = 0; j < n; j++)
        solution.corrected[start + j * stride] = s.corrected[j];

      if (s.method == SolveMethod::nnls)
        solution.method = SolveMethod::nnls;
      solution.clipped += s.clipped;
    }
  }
  return solution;
}
}
