#pragma once

#include "nacorr/correction_matrix.hpp"
#include "ms/instrument.hpp"

#include <string>
#include <vector>

namespace nacorr {

// how well the instrument separates one natural isotope from tracer labels
struct IsotopeResolution {
  std::string isotope;    // e.g. "O17"
  unsigned labels;        // number of tracer labels with the same nominal shift
  double mass_defect;     // Da between the isotope and those labels
  unsigned limit;         // atoms that still merge into a label peak
  double required_ppm;    // needed to tell them apart
  double instrument_ppm;  // what the instrument achieves at the molecule mass
  bool borderline;        // the two ppm values are within 0.5 of each other
};

struct IndistinguishableIsotopes {
  CorrectionOptions options;
  std::vector<IsotopeResolution> isotopes;  // every candidate, selected or not
};

// ppm difference below which a separation is considered borderline
constexpr double borderlinePpm = 0.5;

/**
   Picks the natural isotopes of non-tracer elements that the instrument
   can't resolve from tracer label peaks.

   An isotope is a candidate when its nominal mass shift is a whole number k
   of label shifts. Its correction limit is floor(1.66 * fwhm / delta), where
   fwhm is the peak width at the monoisotopic mass of the formula and delta
   is the mass defect against k labels; isotopes with a nonzero limit are
   selected.
 **/
IndistinguishableIsotopes detectIndistinguishableIsotopes(
    const ms::ElementCounter& formula, const TracerSpec& tracer,
    const ms::InstrumentProfile& instrument);
}
