#include "nacorr/indistinguishable.hpp"
#include "nacorr/errors.hpp"
#include "ms/periodic_table.hpp"

#include <algorithm>
#include <cmath>

namespace nacorr {

// ratio of the full peak width to the peak separation below which two peaks merge
static const double peakMergeFactor = 1.66;

IndistinguishableIsotopes detectIndistinguishableIsotopes(
    const ms::ElementCounter& formula, const TracerSpec& tracer,
    const ms::InstrumentProfile& instrument)
{
  const auto& tracer_element = ms::Element::getByName(tracer.element);
  int tracer_index = tracer_element.findIsotope(tracer.mass_number);
  if (tracer_index < 0 || tracer_element.massShift(tracer_index) <= 0)
    throw InvalidTracerSpec(tracer.name() + " is not a heavy isotope of " + tracer.element);
  double label_mass = tracer_element.isotopes[tracer_index].mass -
                      tracer_element.isotopes[tracer_element.monoisotopicIndex()].mass;

  double molecule_mass = ms::monoisotopicMass(formula);
  double resolving_power = instrument.resolvingPowerAt(molecule_mass);
  double fwhm = instrument.fwhmAt(molecule_mass);
  double instrument_ppm = 1e6 * peakMergeFactor / resolving_power;

  IndistinguishableIsotopes result;
  IsotopeLimits selected;

  for (auto& item : formula) {
    if (item.first == tracer.element)
      continue;
    const auto& element = ms::Element::getByName(item.first);
    const double mono_mass = element.isotopes[element.monoisotopicIndex()].mass;
    for (size_t k = 0; k < element.isotopes.size(); k++) {
      if (element.massShift(k) <= 0)
        continue;
      unsigned shift = static_cast<unsigned>(element.massShift(k));
      if (shift % tracer.label_shift != 0)
        continue;

      IsotopeResolution r;
      r.isotope = element.isotopeName(k);
      r.labels = shift / tracer.label_shift;
      r.mass_defect = std::fabs(element.isotopes[k].mass - mono_mass -
                                r.labels * label_mass);
      unsigned atoms = static_cast<unsigned>(item.second);
      if (r.mass_defect > 0) {
        double limit = std::floor(peakMergeFactor * fwhm / r.mass_defect);
        r.limit = limit >= atoms ? atoms : static_cast<unsigned>(limit);
      } else {
        r.limit = atoms;
      }
      r.required_ppm = 1e6 * r.mass_defect / molecule_mass;
      r.instrument_ppm = instrument_ppm;
      r.borderline = std::fabs(r.required_ppm - r.instrument_ppm) <= borderlinePpm;

      if (r.limit > 0)
        selected[r.isotope] = r.limit;
      result.isotopes.push_back(r);
    }
  }

  result.options = CorrectionOptions::selection(selected);
  return result;
}
}
