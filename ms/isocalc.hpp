#pragma once

#include "ms/shift_distribution.hpp"
#include "ms/periodic_table.hpp"

#include <string>
#include <sstream>
#include <map>
#include <cstdint>
#include <vector>
#include <stdexcept>

namespace ms {
typedef std::map<std::string, int> ElementCounter;

// no element may have more atoms than this
constexpr int maxAtomCount = 65535;

constexpr unsigned unlimitedIsotopeCount = 0xFFFFFFFFu;

double monoisotopicMass(const ElementCounter& counter);
double monoisotopicMass(const std::string& formula);

// Hill notation: C and H first when carbon is present, the rest alphabetically
std::string toString(const ElementCounter& counter);

double logFactorial(unsigned n);

/**
   Distribution of the extra nominal mass carried by atom_count atoms of an
   element relative to the all-monoisotopic composition, i.e. the multinomial
   expansion of its isotope abundances.

   Shifts above max_shift and net shifts below zero (possible for Fe or Se,
   whose lightest isotope isn't the most abundant one) are not counted.
   isotope_limits, when given, caps the number of atoms carrying each isotope
   (indexed like Element::isotopes, the monoisotopic entry is ignored); a zero
   limit removes the isotope altogether, so the result may add up to less
   than one.
 **/
ShiftDistribution elementShiftDistribution(const ms::Element& element,
                                           unsigned atom_count,
                                           size_t max_shift,
                                           const std::vector<unsigned>& isotope_limits={});
}

namespace sf_parser {
class InvalidFormula : public std::runtime_error {
  static std::string format(const std::string& str, size_t pos) {
    std::ostringstream ss;
    ss << str << " at position " << pos;
    return ss.str();
  }

 public:
  InvalidFormula(const std::string& str, size_t pos)
      : std::runtime_error(format(str, pos)) {}

  explicit InvalidFormula(const std::string& str) : std::runtime_error(str) {}
};

class NegativeTotalError : public InvalidFormula {
  static std::string format(const std::string& element, int total) {
    std::ostringstream ss;
    ss << "total number of " << element << " elements (" << total
       << ") is less than zero";
    return ss.str();
  }

 public:
  NegativeTotalError(const std::string& element, int total)
      : InvalidFormula(format(element, total)) {}
};

// Throws ms::UnknownElement for unrecognized symbols and InvalidFormula
// for everything else that is wrong with the input.
ms::ElementCounter parseSumFormula(const std::string& formula);
}
