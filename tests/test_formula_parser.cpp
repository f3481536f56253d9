#include "ms/isocalc.hpp"

#include <cmath>
#include <iostream>
#include <string>

static bool expectInvalid(const std::string& formula) {
  try {
    sf_parser::parseSumFormula(formula);
  } catch (sf_parser::InvalidFormula&) {
    return true;
  }
  std::cerr << "Expected InvalidFormula for '" << formula << "'\n";
  return false;
}

int main() {
  auto glucose = sf_parser::parseSumFormula("C6H12O6");
  if (glucose.size() != 3 || glucose["C"] != 6 || glucose["H"] != 12 || glucose["O"] != 6) {
    std::cerr << "C6H12O6 parsed incorrectly\n";
    return 1;
  }

  auto groups = sf_parser::parseSumFormula("Ca(OH)2");
  if (groups["Ca"] != 1 || groups["O"] != 2 || groups["H"] != 2) {
    std::cerr << "Ca(OH)2 parsed incorrectly\n";
    return 1;
  }

  auto nested = sf_parser::parseSumFormula("(CH3)3(C(OH)2)2");
  if (nested["C"] != 5 || nested["H"] != 13 || nested["O"] != 4) {
    std::cerr << "nested groups parsed incorrectly\n";
    return 1;
  }

  auto hydrate = sf_parser::parseSumFormula("CoSO4.7H2O");
  if (hydrate["Co"] != 1 || hydrate["S"] != 1 || hydrate["O"] != 11 || hydrate["H"] != 14) {
    std::cerr << "CoSO4.7H2O parsed incorrectly\n";
    return 1;
  }

  auto adduct = sf_parser::parseSumFormula("C6H12O6+Na-H");
  if (adduct["H"] != 11 || adduct["Na"] != 1) {
    std::cerr << "adducts parsed incorrectly\n";
    return 1;
  }

  // elements that cancel out disappear from the result
  auto cancelled = sf_parser::parseSumFormula("C2H5Cl-Cl");
  if (cancelled.count("Cl") != 0 || cancelled["C"] != 2) {
    std::cerr << "cancelled element is still present\n";
    return 1;
  }

  try {
    sf_parser::parseSumFormula("Xx2");
    std::cerr << "Expected UnknownElement for Xx2\n";
    return 1;
  } catch (ms::UnknownElement&) {
  }

  try {
    sf_parser::parseSumFormula("H2O-H3");
    std::cerr << "Expected NegativeTotalError\n";
    return 1;
  } catch (sf_parser::NegativeTotalError&) {
  }

  const char* invalid[] = {"", "C0", "C3001", "C6(H2O", "C6)", "c6", "C6H12O6*2", "H2O-"};
  for (auto f : invalid)
    if (!expectInvalid(f))
      return 1;

  if (sf_parser::parseSumFormula("C3000")["C"] != 3000) {
    std::cerr << "C3000 should be accepted\n";
    return 1;
  }

  if (ms::toString(sf_parser::parseSumFormula("O2H7C3")) != "C3H7O2" ||
      ms::toString(sf_parser::parseSumFormula("SO4H2")) != "H2O4S") {
    std::cerr << "formulas are not printed in Hill order\n";
    return 1;
  }

  double water = ms::monoisotopicMass("H2O");
  if (std::fabs(water - 18.0105646837) > 1e-6) {
    std::cerr << "monoisotopic mass of water is " << water << "\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
