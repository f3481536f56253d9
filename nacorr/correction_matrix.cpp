#include "nacorr/correction_matrix.hpp"
#include "nacorr/errors.hpp"
#include "ms/shift_distribution.hpp"
#include "ms/periodic_table.hpp"
#include "utils/string.hpp"
#include "utils/timer.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace nacorr {

std::vector<unsigned> CorrectionOptions::limitsFor(const ms::Element& element) const {
  if (all_isotopes)
    return std::vector<unsigned>();

  std::vector<unsigned> limits(element.isotopes.size(), 0);
  for (auto& item : isotopes) {
    auto parsed = ms::parseIsotopeName(item.first);
    if (parsed.first != element.abbr)
      continue;
    if (parsed.second == 0) {
      for (size_t i = 0; i < limits.size(); i++)
        if (i != element.monoisotopicIndex())
          limits[i] = std::max(limits[i], item.second);
    } else {
      int i = element.findIsotope(parsed.second);
      limits[i] = std::max(limits[i], item.second);
    }
  }
  return limits;
}

std::string CorrectionOptions::key() const {
  if (all_isotopes)
    return "*";
  std::ostringstream ss;
  for (auto it = isotopes.begin(); it != isotopes.end(); ++it) {
    if (it != isotopes.begin())
      ss << ",";
    ss << it->first;
    if (it->second != ms::unlimitedIsotopeCount)
      ss << ":" << it->second;
  }
  return ss.str();
}

CorrectionOptions parseIsotopeSelection(const std::string& text) {
  auto trimmed = utils::trim(text);
  if (trimmed == "*" || trimmed == "all")
    return CorrectionOptions();

  IsotopeLimits isotopes;
  for (auto& token : utils::split(trimmed, ',')) {
    auto item = utils::trim(token);
    if (item.empty())
      continue;

    unsigned limit = ms::unlimitedIsotopeCount;
    auto colon = item.find(':');
    if (colon != std::string::npos) {
      auto limit_str = utils::trim(item.substr(colon + 1));
      item = utils::trim(item.substr(0, colon));
      try {
        size_t pos = 0;
        long value = std::stol(limit_str, &pos);
        if (pos != limit_str.size() || value < 0)
          throw std::invalid_argument(limit_str);
        limit = static_cast<unsigned>(value);
      } catch (std::logic_error&) {
        throw std::invalid_argument("invalid isotope limit '" + limit_str + "'");
      }
    }

    auto parsed = ms::parseIsotopeName(item);
    const auto& element = ms::Element::getByName(parsed.first);
    if (parsed.second != 0 &&
        element.findIsotope(parsed.second) == static_cast<int>(element.monoisotopicIndex()))
      throw std::invalid_argument(item + " is the monoisotopic isotope of " + parsed.first);
    isotopes[item] = limit;
  }
  return CorrectionOptions::selection(isotopes);
}

IntensityVector CorrectionMatrix::forward(const IntensityVector& labeled) const {
  if (labeled.size() != size())
    throw DimensionMismatch(size(), labeled.size());
  Eigen::VectorXd c = Eigen::Map<const Eigen::VectorXd>(labeled.data(), labeled.size());
  Eigen::VectorXd v = m_.transpose() * c;
  return IntensityVector(v.data(), v.data() + v.size());
}

std::vector<double> CorrectionMatrix::rowSums() const {
  Eigen::VectorXd sums = m_.rowwise().sum();
  return std::vector<double>(sums.data(), sums.data() + sums.size());
}

static bool hasSelectedIsotopes(const ms::Element& element, const std::vector<unsigned>& limits) {
  if (limits.empty())
    return true;
  for (size_t i = 0; i < limits.size(); i++)
    if (i != element.monoisotopicIndex() && limits[i] > 0)
      return true;
  return false;
}

CorrectionMatrix buildCorrectionMatrix(const ms::ElementCounter& formula,
                                       const TracerSpec& tracer,
                                       const CorrectionOptions& options)
{
  validateTracer(formula, tracer);

  if (!options.all_isotopes) {
    for (auto& item : options.isotopes)
      if (ms::parseIsotopeName(item.first).first == tracer.element)
        throw InvalidTracerSpec("tracer element " + tracer.element +
                                " can't be an indistinguishable element");
  }

  auto& timer = utils::ProfilingTimer::instance();
  timer.reset();
  timer << ms::toString(formula) << " " << tracer.name();
  timer.start();

  const auto& tracer_element = ms::Element::getByName(tracer.element);
  const size_t n_states = tracer.max_labels + 1;
  const size_t step = tracer.label_shift;
  const size_t max_shift = tracer.max_labels * step;

  // natural background from everything except the tracer element
  ms::ShiftDistribution background;
  for (auto& item : formula) {
    if (item.first == tracer.element)
      continue;
    const auto& element = ms::Element::getByName(item.first);
    auto limits = options.limitsFor(element);
    if (!hasSelectedIsotopes(element, limits))
      continue;
    auto distribution = ms::elementShiftDistribution(element, item.second, max_shift, limits);
    background = background.convolve(distribution, max_shift);
  }

  unsigned tracer_count = tracerAtomCount(formula, tracer);
  Eigen::MatrixXd m = Eigen::MatrixXd::Zero(n_states, n_states);
  for (size_t i = 0; i < n_states; i++) {
    size_t row_shift = (n_states - 1 - i) * step;
    auto unlabeled = ms::elementShiftDistribution(tracer_element, tracer_count - i, row_shift);
    auto shifts = background.convolve(unlabeled, row_shift).strided(step, n_states - i);
    for (size_t j = i; j < n_states; j++)
      m(i, j) = shifts[j - i];

    double total = m.row(i).sum();
    if (!(total > 0))
      throw SingularCorrectionMatrix("natural abundance distribution vanishes for " +
                                     ms::toString(formula));
    m.row(i) /= total;
  }

  timer.stop();
  return CorrectionMatrix(m);
}
}
