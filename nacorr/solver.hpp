#pragma once

#include "nacorr/correction_matrix.hpp"

#include <Eigen/Dense>

#include <vector>

namespace nacorr {

enum class SolveMethod {
  exact,  // LU solution was already non-negative
  nnls    // non-negative least squares fallback
};

const char* toString(SolveMethod method);

struct Solution {
  IntensityVector corrected;
  SolveMethod method;
  size_t clipped;  // entries raised from tiny negative values to zero
};

// Lawson-Hanson active set method: argmin ||Ax - b|| subject to x >= 0.
// max_iterations = 0 picks 3 * (number of columns) + 10.
Eigen::VectorXd nonNegativeLeastSquares(const Eigen::MatrixXd& a, const Eigen::VectorXd& b,
                                        size_t max_iterations = 0);

/**
   Recovers the true label distribution c >= 0 from observed intensities,
   where observed ~ M^T c.

   Throws DimensionMismatch if the vector doesn't match the matrix,
   InvalidIntensity for negative or non-finite observations and
   SingularCorrectionMatrix when M admits no solution at all.
 **/
Solution solveCorrection(const CorrectionMatrix& m, const IntensityVector& observed);
}
