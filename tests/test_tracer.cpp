#include "nacorr/tracer.hpp"
#include "nacorr/errors.hpp"
#include "ms/isocalc.hpp"

#include <iostream>
#include <string>

int main() {
  auto c = nacorr::parseTracer("C");
  if (c.element != "C" || c.mass_number != 13 || c.label_shift != 1 || c.name() != "C13") {
    std::cerr << "bare C should select 13C\n";
    return 1;
  }

  auto n15 = nacorr::parseTracer("N15");
  auto h2 = nacorr::parseTracer("H2");
  auto s34 = nacorr::parseTracer("S34");
  auto s = nacorr::parseTracer("S");
  auto o18 = nacorr::parseTracer("O18");
  if (n15.label_shift != 1 || h2.label_shift != 1 || s34.label_shift != 2 ||
      s.mass_number != 34 || o18.label_shift != 2) {
    std::cerr << "unexpected label shifts\n";
    return 1;
  }

  // shifts count from 56Fe, so 58Fe adds two
  auto fe = nacorr::parseTracer("Fe");
  auto fe58 = nacorr::parseTracer("Fe58");
  if (fe.mass_number != 57 || fe.label_shift != 1 || fe58.label_shift != 2) {
    std::cerr << "unexpected iron tracers\n";
    return 1;
  }

  const char* invalid[] = {"C12", "Na", "F", "Fe54", "Fe56", "Se78"};
  for (auto t : invalid) {
    try {
      nacorr::parseTracer(t);
      std::cerr << "Expected InvalidTracerSpec for " << t << "\n";
      return 1;
    } catch (nacorr::InvalidTracerSpec&) {
    }
  }

  try {
    nacorr::parseTracer("C14");
    std::cerr << "Expected UnknownElement for C14\n";
    return 1;
  } catch (ms::UnknownElement&) {
  }

  auto formula = sf_parser::parseSumFormula("C5H9NO4");
  auto full = nacorr::resolveTracer(formula, "C13");
  auto partial = nacorr::resolveTracer(formula, "C13", 2);
  if (full.max_labels != 5 || partial.max_labels != 2 ||
      nacorr::tracerAtomCount(formula, full) != 5) {
    std::cerr << "unexpected label counts\n";
    return 1;
  }

  try {
    nacorr::resolveTracer(formula, "C13", 6);
    std::cerr << "Expected failure for more labels than atoms\n";
    return 1;
  } catch (nacorr::InvalidTracerSpec&) {
  }

  try {
    nacorr::resolveTracer(formula, "S34");
    std::cerr << "Expected failure for a tracer absent from the formula\n";
    return 1;
  } catch (nacorr::InvalidTracerSpec&) {
  }

  std::cout << "OK\n";
  return 0;
}
