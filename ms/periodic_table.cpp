#include "ms/periodic_table.hpp"

#include <cctype>

namespace ms {

// Isotope masses and natural abundances from the CRC Handbook of Chemistry
// and Physics, 83rd edition.
const std::map<std::string, ms::Element> periodic_table{
  {"H", {"H", 1, {{1, 1.00782503207, 0.999885},
                  {2, 2.0141017778, 0.000115}}}},
  {"C", {"C", 6, {{12, 12.0, 0.9893},
                  {13, 13.0033548378, 0.0107}}}},
  {"N", {"N", 7, {{14, 14.0030740048, 0.99632},
                  {15, 15.0001088982, 0.00368}}}},
  {"O", {"O", 8, {{16, 15.99491461956, 0.99757},
                  {17, 16.99913170, 0.00038},
                  {18, 17.9991610, 0.00205}}}},
  {"F", {"F", 9, {{19, 18.99840322, 1.0}}}},
  {"Na", {"Na", 11, {{23, 22.9897692809, 1.0}}}},
  {"Mg", {"Mg", 12, {{24, 23.985041700, 0.7899},
                     {25, 24.98583692, 0.1000},
                     {26, 25.982592929, 0.1101}}}},
  {"Si", {"Si", 14, {{28, 27.9769265325, 0.922297},
                     {29, 28.976494700, 0.046832},
                     {30, 29.97377017, 0.030872}}}},
  {"P", {"P", 15, {{31, 30.97376163, 1.0}}}},
  {"S", {"S", 16, {{32, 31.97207100, 0.9493},
                   {33, 32.97145876, 0.0076},
                   {34, 33.96786690, 0.0429},
                   {36, 35.96708076, 0.0002}}}},
  {"Cl", {"Cl", 17, {{35, 34.96885268, 0.7578},
                     {37, 36.96590259, 0.2422}}}},
  {"K", {"K", 19, {{39, 38.96370668, 0.932581},
                   {40, 39.96399848, 0.000117},
                   {41, 40.96182576, 0.067302}}}},
  {"Ca", {"Ca", 20, {{40, 39.96259098, 0.96941},
                     {42, 41.95861801, 0.00647},
                     {43, 42.9587666, 0.00135},
                     {44, 43.9554818, 0.02086},
                     {46, 45.9536926, 0.00004},
                     {48, 47.952534, 0.00187}}}},
  {"Fe", {"Fe", 26, {{54, 53.9396105, 0.05845},
                     {56, 55.9349375, 0.91754},
                     {57, 56.9353940, 0.02119},
                     {58, 57.9332756, 0.00282}}}},
  {"Co", {"Co", 27, {{59, 58.9331950, 1.0}}}},
  {"Se", {"Se", 34, {{74, 73.9224764, 0.0089},
                     {76, 75.9192136, 0.0937},
                     {77, 76.9199140, 0.0763},
                     {78, 77.9173091, 0.2377},
                     {80, 79.9165213, 0.4961},
                     {82, 81.9166994, 0.0873}}}},
  {"Br", {"Br", 35, {{79, 78.9183371, 0.5069},
                     {81, 80.9162906, 0.4931}}}},
  {"I", {"I", 53, {{127, 126.904473, 1.0}}}}
};

std::pair<std::string, unsigned> parseIsotopeName(const std::string& name) {
  size_t n = 0;
  while (n < name.size() && std::isalpha(static_cast<unsigned char>(name[n])))
    ++n;
  std::string symbol = name.substr(0, n);
  if (symbol.empty() || !Element::isKnown(symbol))
    throw UnknownElement(name);

  unsigned mass_number = 0;
  for (size_t i = n; i < name.size(); i++) {
    if (!std::isdigit(static_cast<unsigned char>(name[i])) || mass_number > 1000)
      throw UnknownElement(name);
    mass_number = mass_number * 10 + (name[i] - '0');
  }

  if (mass_number != 0 && Element::getByName(symbol).findIsotope(mass_number) < 0)
    throw UnknownElement(name);

  return std::make_pair(symbol, mass_number);
}
}
