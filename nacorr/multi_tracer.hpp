#pragma once

#include "nacorr/correction_matrix.hpp"
#include "nacorr/indistinguishable.hpp"
#include "nacorr/solver.hpp"
#include "ms/instrument.hpp"

#include <map>
#include <string>
#include <vector>

namespace nacorr {

/**
   Label states of a molecule carrying several tracers (13C and 15N, say),
   one axis per tracer with label counts 0..N_k. Intensities are stored flat
   with the last tracer varying fastest.
 **/
class LabelGrid {
  std::vector<size_t> dims_;

 public:
  explicit LabelGrid(const std::vector<TracerSpec>& tracers);
  explicit LabelGrid(const std::vector<size_t>& dimensions);

  size_t rank() const { return dims_.size(); }
  size_t size() const;
  const std::vector<size_t>& dimensions() const { return dims_; }

  // flat position of a label state; DimensionMismatch when out of range
  size_t index(const std::vector<unsigned>& counts) const;
  std::vector<unsigned> counts(size_t index) const;

  // distance between neighbouring states along an axis
  size_t stride(size_t axis) const;
};

// Resolves every tracer against the formula with as many label states as
// there are atoms of its element.
std::vector<TracerSpec> resolveTracers(const ms::ElementCounter& formula,
                                       const std::vector<TracerSpec>& tracers);

// The formula as corrected for one tracer: elements of the other tracers are
// removed, their natural isotopes belong to their own pass.
ms::ElementCounter formulaForTracer(const ms::ElementCounter& formula,
                                    const std::vector<TracerSpec>& tracers, size_t axis);

/**
   Isotope selection for every tracer of a group. Natural isotopes of
   non-tracer elements are corrected once: in the first tracer's pass with
   first_tracer unless per_tracer names other selections. Tracers without an
   entry in per_tracer (and not first) correct their own element only.

   Throws InvalidTracerSpec when a selection names a tracer element.
 **/
std::vector<CorrectionOptions> selectIsotopes(const std::vector<TracerSpec>& tracers,
                                              const CorrectionOptions& first_tracer,
                                              const std::map<std::string, CorrectionOptions>& per_tracer);

// Autodetection for several tracers. An isotope that merges with the labels
// of more than one tracer goes to the one with the smallest mass defect.
std::vector<IndistinguishableIsotopes> detectIndistinguishableIsotopes(
    const ms::ElementCounter& formula, const std::vector<TracerSpec>& tracers,
    const ms::InstrumentProfile& instrument);

// "C13=H,O17:2;N15=H" -> selection per tracer name. An entry without a
// tracer name ("H,O17" or "*") is stored under the empty key.
std::map<std::string, CorrectionOptions> parseTracerSelections(const std::string& text);

/**
   Corrects a flat grid of intensities one tracer at a time: along each
   axis, every line of states with the other label counts held fixed is
   solved with that tracer's matrix. matrices[k] belongs to axis k.

   The method is nnls when any line needed it; clipped entries are summed
   over all lines.
 **/
Solution solveMultiTracer(const LabelGrid& grid,
                          const std::vector<CorrectionMatrixPtr>& matrices,
                          const IntensityVector& observed);
}
