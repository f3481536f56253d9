#include "ms/isocalc.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace ms {

struct LogFacTable {
  // just compute them all to avoid branch mispredictions;
  // nobody cares about 0.5MB these days
  double table[maxAtomCount + 1];

  LogFacTable() {
    for (int i = 0; i <= maxAtomCount; i++) table[i] = std::lgamma(i + 1);
  }

  double operator[](size_t i) const { return table[i]; }
};

static LogFacTable log_fac_table;

double logFactorial(unsigned n) {
  if (n > static_cast<unsigned>(maxAtomCount))
    throw std::out_of_range("atom count is too big");
  return log_fac_table[n];
}

// Enumerates isotope compositions (k_0, ..., k_m) of a fixed number of atoms
// in order of isotope index; the monoisotopic isotope takes whatever atoms are
// left. Each complete composition adds its multinomial probability to the
// bucket of its net mass shift. Compositions below the monoisotopic mass are
// dropped like those above max_shift.
class MultinomialShiftEnumerator {
  const ms::Element& element_;
  unsigned atom_count_;
  long max_shift_;
  long top_shift_;
  std::vector<unsigned> max_counts_;
  std::vector<size_t> order_;
  std::vector<double>& out_;

  void enumerate(size_t p, unsigned used, long shift, double log_prob) {
    if (p == order_.size()) {
      if (shift < 0)
        return;
      unsigned k0 = atom_count_ - used;
      double result = log_prob + logFactorial(atom_count_) - logFactorial(k0);
      if (k0 > 0)
        result += k0 * element_.logProbability(element_.monoisotopicIndex());
      out_[shift] += std::exp(result);
      return;
    }

    // lighter isotopes come first; stop once the remaining atoms can't
    // bring the shift back to zero
    if (shift + long(atom_count_ - used) * top_shift_ < 0)
      return;

    size_t i = order_[p];
    long iso_shift = element_.massShift(i);
    unsigned max_k = std::min(atom_count_ - used, max_counts_[i]);
    if (iso_shift > 0)
      max_k = static_cast<unsigned>(std::min<long>(max_k, (max_shift_ - shift) / iso_shift));

    for (unsigned k = 0; k <= max_k; k++) {
      double lp = log_prob - logFactorial(k);
      if (k > 0)
        lp += k * element_.logProbability(i);
      enumerate(p + 1, used + k, shift + long(k) * iso_shift, lp);
    }
  }

 public:
  MultinomialShiftEnumerator(const ms::Element& element, unsigned atom_count,
                             size_t max_shift, const std::vector<unsigned>& limits,
                             std::vector<double>& out) :
    element_(element), atom_count_(atom_count), max_shift_(long(max_shift)),
    top_shift_(std::max(0, element.massShift(element.isotopes.size() - 1))),
    max_counts_(element.isotopes.size(), unlimitedIsotopeCount), out_(out)
  {
    for (size_t i = 0; i < max_counts_.size(); i++) {
      if (i == element.monoisotopicIndex())
        continue;
      if (i < limits.size())
        max_counts_[i] = limits[i];
      if (!(element.isotopes[i].abundance > 0))
        max_counts_[i] = 0;
      if (max_counts_[i] > 0)
        order_.push_back(i);
    }
  }

  void run() {
    enumerate(0, 0, 0, 0.0);
  }
};

ShiftDistribution elementShiftDistribution(const ms::Element& element,
                                           unsigned atom_count,
                                           size_t max_shift,
                                           const std::vector<unsigned>& isotope_limits)
{
  if (atom_count == 0 || element.isotopes.size() == 1)
    return ShiftDistribution();

  if (atom_count > static_cast<unsigned>(maxAtomCount))
    throw std::out_of_range("atom count is too big");

  size_t top_shift = std::max(0, element.massShift(element.isotopes.size() - 1));
  size_t n = std::min<size_t>(max_shift, size_t(atom_count) * top_shift);
  std::vector<double> probabilities(n + 1, 0.0);
  MultinomialShiftEnumerator enumerator{element, atom_count, n, isotope_limits, probabilities};
  enumerator.run();
  return ShiftDistribution{probabilities};
}

double monoisotopicMass(const ElementCounter& counter) {
  double sum = 0.0;
  for (auto& item : counter) {
    const auto& element = ms::Element::getByName(item.first);
    sum += item.second * element.isotopes[element.monoisotopicIndex()].mass;
  }
  return sum;
}

double monoisotopicMass(const std::string& formula) {
  return monoisotopicMass(::sf_parser::parseSumFormula(formula));
}

std::string toString(const ElementCounter& counter) {
  std::vector<std::string> order;
  bool has_carbon = counter.count("C") > 0;
  if (has_carbon) {
    order.push_back("C");
    if (counter.count("H") > 0)
      order.push_back("H");
  }
  for (auto& item : counter)
    if (!has_carbon || (item.first != "C" && item.first != "H"))
      order.push_back(item.first);

  std::ostringstream ss;
  for (auto& element : order) {
    int count = counter.at(element);
    ss << element;
    if (count != 1)
      ss << count;
  }
  return ss.str();
}
}

namespace sf_parser {
typedef ms::ElementCounter ElementCounter;

class SumFormulaParser {
  std::string s;
  size_t n;
  ElementCounter counter_;

 public:
  SumFormulaParser(const std::string& input) : s(input), n(0) {
    parseSumFormula(counter_);
  }

  const ElementCounter& elementCounts() const { return counter_; }

 private:
  bool eof() const { return n >= s.length(); }

  void checkAvailable() const {
    if (eof()) throw InvalidFormula("unexpected end of input", n);
  }

  char nextChar() {
    checkAvailable();
    return s[n++];
  }

  char peek() const {
    checkAvailable();
    return s[n];
  }

  static bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
  static bool isUpper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
  static bool isLower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }

  int parseOptionalNumber() {
    if (eof() || !isDigit(peek())) return 1;
    auto pos = n;
    int result = 0;
    while (!eof() && isDigit(peek())) {
      result = result * 10 + (nextChar() - '0');
      if (result > 3000) throw InvalidFormula("the number is too big", pos);
    }
    if (result == 0) throw InvalidFormula("zero count", pos);
    return result;
  }

  static void add(ElementCounter& counter, const std::string& element, long count) {
    long total = counter[element] + count;
    if (total > ms::maxAtomCount) throw InvalidFormula("too many " + element + " atoms");
    counter[element] = static_cast<int>(total);
  }

  void parseElement(ElementCounter& counter) {
    auto pos = n;
    std::string element;
    element.push_back(nextChar());
    if (!isUpper(element.back())) throw InvalidFormula("expected an element", pos);
    while (!eof() && isLower(peek()))
      element.push_back(nextChar());
    if (!ms::Element::isKnown(element))
      throw ms::UnknownElement(element);
    int num = parseOptionalNumber();
    add(counter, element, num);
  }

  void parseSimpleFragment(ElementCounter& counter) {
    while (!eof() && isUpper(peek())) {
      parseElement(counter);
    }
  }

  void parseFragment(ElementCounter& counter) {
    checkAvailable();

    if (peek() == '(') {
      nextChar();
      ElementCounter tmp;
      parseFragment(tmp);
      while (!eof() && peek() != ')')
        parseFragment(tmp);
      if (eof() || nextChar() != ')')
        throw InvalidFormula("expected closing parenthesis", n);
      auto repeats = parseOptionalNumber();
      for (auto& item : tmp)
        add(counter, item.first, long(item.second) * repeats);
    } else if (isUpper(peek())) { parseSimpleFragment(counter); } else {
      throw InvalidFormula(std::string{"unexpected character '"} + peek() + "'", n);
    }
  }

  void parseMolecularComplex(ElementCounter& counter) {
    ElementCounter tmp;
    auto repeats = parseOptionalNumber();
    parseFragment(tmp);
    while (!eof()) {
      if (peek() == '.' || peek() == '-' || peek() == '+') break;
      parseFragment(tmp);
    }
    for (auto& item : tmp)
      add(counter, item.first, long(repeats) * item.second);
  }

  void parseSumFormula(ElementCounter& counter) {
    parseMolecularComplex(counter);

    while (!eof()) {
      if (peek() == '.') {
        nextChar();
        parseMolecularComplex(counter);
      } else { break; }
    }

    while (!eof()) {
      ElementCounter adduct;
      char sign = nextChar();
      int mult;
      if (sign == '-')
        mult = -1;
      else if (sign == '+')
        mult = 1;
      else
        throw InvalidFormula("expected +/-", n - 1);
      parseMolecularComplex(adduct);
      for (auto& item : adduct)
        add(counter, item.first, long(mult) * item.second);
    }

    for (auto it = counter.begin(); it != counter.end(); ) {
      if (it->second < 0) throw NegativeTotalError(it->first, it->second);
      if (it->second != 0)
        ++it;
      else
        it = counter.erase(it);
    }

    if (counter.empty())
      throw InvalidFormula("formula contains no atoms");
  }
};

ms::ElementCounter parseSumFormula(const std::string& formula) {
  sf_parser::SumFormulaParser parser{formula};
  return parser.elementCounts();
}
}
