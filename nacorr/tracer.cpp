#include "nacorr/tracer.hpp"
#include "nacorr/errors.hpp"
#include "ms/periodic_table.hpp"
#include "utils/string.hpp"

#include <sstream>

namespace nacorr {

std::string TracerSpec::name() const {
  std::ostringstream ss;
  ss << element << mass_number;
  return ss.str();
}

TracerSpec parseTracer(const std::string& tracer) {
  auto parsed = ms::parseIsotopeName(tracer);
  const auto& element = ms::Element::getByName(parsed.first);

  int isotope = parsed.second == 0 ? element.mostAbundantHeavyIsotope()
                                   : element.findIsotope(parsed.second);
  if (isotope < 0)
    throw InvalidTracerSpec("element " + element.abbr + " has no heavy isotope to trace");
  if (element.massShift(isotope) <= 0)
    throw InvalidTracerSpec(tracer + " isn't heavier than the monoisotopic " +
                            element.isotopeName(element.monoisotopicIndex()) +
                            " and can't be a tracer");

  TracerSpec spec;
  spec.element = element.abbr;
  spec.mass_number = element.isotopes[isotope].mass_number;
  spec.label_shift = static_cast<unsigned>(element.massShift(isotope));
  spec.max_labels = 0;
  return spec;
}

std::vector<TracerSpec> parseTracers(const std::string& tracers) {
  std::vector<TracerSpec> result;
  for (auto& item : utils::split(tracers, ',')) {
    auto name = utils::trim(item);
    if (name.empty())
      continue;
    auto spec = parseTracer(name);
    for (auto& other : result)
      if (other.element == spec.element)
        throw InvalidTracerSpec("element " + spec.element + " is traced twice in " + tracers);
    result.push_back(spec);
  }
  if (result.empty())
    throw InvalidTracerSpec("no tracer given");
  return result;
}

unsigned tracerAtomCount(const ms::ElementCounter& formula, const TracerSpec& tracer) {
  auto it = formula.find(tracer.element);
  return it == formula.end() ? 0 : static_cast<unsigned>(it->second);
}

void validateTracer(const ms::ElementCounter& formula, const TracerSpec& tracer) {
  unsigned count = tracerAtomCount(formula, tracer);
  if (count == 0)
    throw InvalidTracerSpec("tracer element " + tracer.element + " is absent from " +
                            ms::toString(formula));
  if (tracer.max_labels > count) {
    std::ostringstream ss;
    ss << "label count " << tracer.max_labels << " exceeds the number of "
       << tracer.element << " atoms in " << ms::toString(formula) << " (" << count << ")";
    throw InvalidTracerSpec(ss.str());
  }
}

TracerSpec resolveTracer(const ms::ElementCounter& formula,
                         const std::string& tracer, int max_labels) {
  TracerSpec spec = parseTracer(tracer);
  unsigned count = tracerAtomCount(formula, spec);
  spec.max_labels = max_labels < 0 ? count : static_cast<unsigned>(max_labels);
  validateTracer(formula, spec);
  return spec;
}
}
