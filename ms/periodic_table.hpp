#pragma once

#include <map>
#include <vector>
#include <string>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <cmath>

namespace ms {

class UnknownElement : public std::runtime_error {
 public:
  UnknownElement(const std::string& symbol)
      : std::runtime_error("unknown element '" + symbol + "'") {}
};

struct Isotope {
  unsigned mass_number;
  double mass;
  double abundance;
};

struct Element;
extern const std::map<std::string, ms::Element> periodic_table;

struct Element {
  std::string abbr;
  unsigned number;
  std::vector<Isotope> isotopes;  // mass-sorted, lightest first

private:
  std::vector<double> log_probs_;
  size_t monoisotopic_;

public:

  Element(const std::string& abbr, unsigned atomicNumber, const std::vector<Isotope>& isotopes) :
    abbr{abbr}, number{atomicNumber}, isotopes{isotopes},
    log_probs_(isotopes.size()), monoisotopic_(0)
  {
    double total_abundance = 0.0;
    for (auto& isotope: this->isotopes)
      total_abundance += isotope.abundance;

    for (size_t i = 0; i < this->isotopes.size(); i++) {
      this->isotopes[i].abundance /= total_abundance;
      log_probs_[i] = std::log(this->isotopes[i].abundance);
      if (this->isotopes[i].abundance > this->isotopes[monoisotopic_].abundance)
        monoisotopic_ = i;
    }
  }

  // log-probability of i-th isotope (counting from the lightest)
  double logProbability(size_t i) const {
    return log_probs_[i];
  }

  // index of the most abundant isotope, the one that makes up the monoisotopic peak
  size_t monoisotopicIndex() const {
    return monoisotopic_;
  }

  // nominal mass difference between i-th isotope and the monoisotopic one,
  // negative for lighter isotopes (54Fe, 74Se)
  int massShift(size_t i) const {
    return static_cast<int>(isotopes[i].mass_number) -
           static_cast<int>(isotopes[monoisotopic_].mass_number);
  }

  // index of the isotope with a given mass number, or -1
  int findIsotope(unsigned mass_number) const {
    for (size_t i = 0; i < isotopes.size(); i++)
      if (isotopes[i].mass_number == mass_number)
        return static_cast<int>(i);
    return -1;
  }

  // most abundant isotope heavier than the monoisotopic one, or -1 if there is none
  int mostAbundantHeavyIsotope() const {
    int best = -1;
    for (size_t i = monoisotopic_ + 1; i < isotopes.size(); i++)
      if (best < 0 || isotopes[i].abundance > isotopes[best].abundance)
        best = static_cast<int>(i);
    return best;
  }

  std::string isotopeName(size_t i) const {
    std::ostringstream ss;
    ss << abbr << isotopes[i].mass_number;
    return ss.str();
  }

  static bool isKnown(const std::string& abbr) {
    return periodic_table.find(abbr) != periodic_table.end();
  }

  static const Element& getByName(const std::string& abbr) {
    auto it = periodic_table.find(abbr);
    if (it == periodic_table.end())
      throw UnknownElement(abbr);
    return it->second;
  }
};

// Splits isotope notation such as "O17" or "C" into the element symbol and
// mass number (0 when absent). Throws UnknownElement for unknown symbols and
// for mass numbers the element doesn't have.
std::pair<std::string, unsigned> parseIsotopeName(const std::string& name);
}
