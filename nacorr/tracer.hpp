#pragma once

#include "ms/isocalc.hpp"

#include <string>
#include <vector>

namespace nacorr {

struct TracerSpec {
  std::string element;   // labeled element, e.g. "C"
  unsigned mass_number;  // tracer isotope, e.g. 13
  unsigned label_shift;  // nominal mass added by one labeled atom
  unsigned max_labels;   // N, label states are 0..N

  // isotope notation, e.g. "C13"
  std::string name() const;
};

// Parses "C13", "N15", "S34" or a bare element symbol, which selects its most
// abundant heavy isotope. max_labels is left at zero.
TracerSpec parseTracer(const std::string& tracer);

// Comma separated tracers, e.g. "C13,N15"; each element may appear once.
std::vector<TracerSpec> parseTracers(const std::string& tracers);

// Tracer for a particular formula. max_labels < 0 means as many labels as
// the formula has atoms of the tracer element.
TracerSpec resolveTracer(const ms::ElementCounter& formula,
                         const std::string& tracer, int max_labels = -1);

// Throws InvalidTracerSpec unless the tracer element is in the formula and
// max_labels doesn't exceed its atom count.
void validateTracer(const ms::ElementCounter& formula, const TracerSpec& tracer);

// number of atoms of the tracer element in the formula
unsigned tracerAtomCount(const ms::ElementCounter& formula, const TracerSpec& tracer);
}
