#pragma once

#include "nacorr/tracer.hpp"
#include "ms/isocalc.hpp"

#include <Eigen/Dense>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nacorr {

typedef std::vector<double> IntensityVector;

// isotope name ("O17") or element symbol ("H") -> maximum number of atoms
// that may carry it
typedef std::map<std::string, unsigned> IsotopeLimits;

// Which natural isotopes of non-tracer elements end up in the label peaks.
// Isotopes of the tracer element itself are always taken into account.
struct CorrectionOptions {
  bool all_isotopes;
  IsotopeLimits isotopes;  // consulted only when all_isotopes is false

  CorrectionOptions() : all_isotopes(true) {}

  static CorrectionOptions selection(const IsotopeLimits& isotopes) {
    CorrectionOptions options;
    options.all_isotopes = false;
    options.isotopes = isotopes;
    return options;
  }

  // per-isotope limits for an element, indexed like Element::isotopes;
  // empty when nothing is restricted
  std::vector<unsigned> limitsFor(const ms::Element& element) const;

  // canonical text form, "*" when all isotopes are used
  std::string key() const;
};

// Parses "H,O17:2,S" into a selection. "*" (or "all") selects everything.
CorrectionOptions parseIsotopeSelection(const std::string& text);

class CorrectionMatrix {
  Eigen::MatrixXd m_;

 public:
  explicit CorrectionMatrix(const Eigen::MatrixXd& m) : m_(m) {}

  // N + 1
  size_t size() const { return m_.rows(); }

  size_t maxLabels() const { return size() - 1; }

  // probability that a molecule with i labeled atoms is observed as j-labeled
  double operator()(size_t i, size_t j) const { return m_(i, j); }

  const Eigen::MatrixXd& matrix() const { return m_; }

  // expected observation for a distribution of true label states
  IntensityVector forward(const IntensityVector& labeled) const;

  std::vector<double> rowSums() const;
};

typedef std::shared_ptr<const CorrectionMatrix> CorrectionMatrixPtr;

/**
   Builds the (N+1)x(N+1) matrix M for a formula and tracer.

   Row i is the distribution of the observed label state of a molecule that
   carries i labeled tracer atoms: the natural isotopes of every selected
   non-tracer element together with all isotopes of the remaining unlabeled
   tracer atoms push it up by whole label shifts. Probability mass that ends
   beyond N, or between label peaks, is dropped and the row renormalized.
 **/
CorrectionMatrix buildCorrectionMatrix(const ms::ElementCounter& formula,
                                       const TracerSpec& tracer,
                                       const CorrectionOptions& options=CorrectionOptions());
}
