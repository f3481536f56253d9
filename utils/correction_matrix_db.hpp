#pragma once

#include "nacorr/correction_matrix.hpp"
#include "nacorr/matrix_cache.hpp"

#include <map>
#include <string>
#include <vector>

namespace utils {

// Precomputed correction matrices for (formula, tracer) pairs, all built with
// the same isotope selection and stored in msgpack format.
class CorrectionMatrixDB {
  typedef std::pair<std::string, std::string> FormulaTracerPair;
  std::vector<FormulaTracerPair> pairs_;

  std::string options_;  // CorrectionOptions::key()

  // use a simple structure that doesn't require special msgpack methods
  std::map<FormulaTracerPair, std::map<std::string, std::vector<double>>> matrices_;

  // pairs that couldn't be computed, with the reason
  std::map<FormulaTracerPair, std::string> failures_;

  bool use_progressbar_;

  static std::vector<FormulaTracerPair> makePairs(const std::vector<std::string>& formulas,
                                                  const std::string& tracer) {
    std::vector<FormulaTracerPair> pairs;
    for (auto& f : formulas)
      pairs.push_back(std::make_pair(f, tracer));
    return pairs;
  }

 public:
  void save(const std::string& output_filename) const;
  void load(const std::string& input_filename);

  CorrectionMatrixDB(const std::vector<std::string>& formulas, const std::string& tracer)
      : CorrectionMatrixDB(makePairs(formulas, tracer)) {}

  explicit CorrectionMatrixDB(const std::vector<FormulaTracerPair>& formula_tracer_pairs)
      : pairs_(formula_tracer_pairs), options_("*"), use_progressbar_(false) {}

  explicit CorrectionMatrixDB(const std::string& dump_filename) : use_progressbar_(false) {
    load(dump_filename);
  }

  void computeCorrectionMatrices(
      const nacorr::CorrectionOptions& options=nacorr::CorrectionOptions());

  // throws std::out_of_range for pairs that are not in the database
  nacorr::CorrectionMatrix operator()(const std::string& formula,
                                      const std::string& tracer) const;

  bool contains(const std::string& formula, const std::string& tracer) const {
    return matrices_.count(std::make_pair(formula, tracer)) > 0;
  }

  nacorr::CorrectionOptions options() const {
    return nacorr::parseIsotopeSelection(options_);
  }

  // makes every stored matrix available to the workflow
  void fillCache(nacorr::CorrectionMatrixCache& cache) const;

  void useProgressBar(bool use) { use_progressbar_ = use; }

  size_t size() const { return matrices_.size(); }

  const std::vector<FormulaTracerPair>& keys() const { return pairs_; }

  const std::map<FormulaTracerPair, std::string>& failures() const { return failures_; }
};
}
