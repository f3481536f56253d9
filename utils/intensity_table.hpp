#pragma once

#include "nacorr/workflow.hpp"

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace utils {

// one row of a long-format table: Name,Formula,Label,Sample,Intensity
struct IntensityRecord {
  std::string name;
  std::string formula;
  std::string label;
  std::string sample;
  double intensity;
};

class InvalidTable : public std::runtime_error {
 public:
  InvalidTable(const std::string& msg, size_t line)
      : std::runtime_error("line " + std::to_string(line) + ": " + msg) {}
  explicit InvalidTable(const std::string& msg) : std::runtime_error(msg) {}
};

struct LabelState {
  std::vector<std::string> isotopes;  // {"C13", "N15"}; empty for the unlabeled parent
  std::vector<unsigned> counts;       // one per isotope
};

// "C12 PARENT" -> {}, "C13-label-2" -> {C13: 2}, "C13N15-label-1-2" -> {C13: 1, N15: 2}.
// Counts above ms::maxAtomCount are rejected.
LabelState parseLabel(const std::string& label);

// inverse of parseLabel for the given tracer
std::string formatLabel(const nacorr::TracerSpec& tracer, unsigned count);

// "C13N15-label-1-0" for every state but the parent, which is named after
// the monoisotopic isotope of the first tracer
std::string formatLabel(const std::vector<nacorr::TracerSpec>& tracers,
                        const std::vector<unsigned>& counts);

// fields of a comma-separated line, double quotes allowed around fields
std::vector<std::string> splitCsvLine(const std::string& line);

// The header must name the Name, Formula, Label, Sample and Intensity columns
// (in any order, other columns are ignored).
std::vector<IntensityRecord> readIntensityTable(std::istream& in);
std::vector<IntensityRecord> readIntensityTable(const std::string& filename);

/**
   Collects records into one group per (metabolite, sample), in the order
   of first appearance. Label states that are absent in between are zero;
   trailing ones are left out.

   With several tracers ("C13,N15") the states go to MetaboliteSample::labeled;
   a label naming a subset of the tracers ("C13-label-2") has zero labels of
   the others.

   Throws InvalidTable for labels of other tracers, repeated labels and
   metabolites listed with more than one formula.
 **/
std::vector<nacorr::MetaboliteSample> groupRecords(const std::vector<IntensityRecord>& records,
                                                   const std::string& tracer);

// Name,Formula,Sample,Label,Intensity,NA Corrected,Pool Total,Fractional Enrichment;
// groups that failed are skipped
void writeCorrectedTable(std::ostream& out,
                         const std::vector<nacorr::MetaboliteSample>& groups,
                         const std::vector<nacorr::GroupOutcome>& outcomes);
}
