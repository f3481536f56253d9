#include "nacorr/solver.hpp"
#include "nacorr/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace nacorr {

const char* toString(SolveMethod method) {
  switch (method) {
    case SolveMethod::exact: return "exact";
    case SolveMethod::nnls: return "nnls";
  }
  return "unknown";
}

Eigen::VectorXd nonNegativeLeastSquares(const Eigen::MatrixXd& a, const Eigen::VectorXd& b,
                                        size_t max_iterations) {
  typedef Eigen::Index Index;
  if (a.rows() != b.size())
    throw DimensionMismatch(a.rows(), b.size());

  const Index n = a.cols();
  if (max_iterations == 0)
    max_iterations = 3 * n + 10;

  const double eps = std::numeric_limits<double>::epsilon();
  const double a_norm = a.cwiseAbs().colwise().sum().maxCoeff();
  const double b_norm = b.size() > 0 ? b.cwiseAbs().maxCoeff() : 0.0;
  const double tol = 10 * eps * a_norm * std::max(a.rows(), n) * std::max(1.0, b_norm);

  Eigen::VectorXd x = Eigen::VectorXd::Zero(n);
  std::vector<bool> passive(n, false), excluded(n, false);
  Eigen::VectorXd w = a.transpose() * b;
  size_t iterations = 0;

  while (true) {
    Index t = -1;
    double best = tol;
    for (Index j = 0; j < n; j++) {
      if (!passive[j] && !excluded[j] && w(j) > best) {
        best = w(j);
        t = j;
      }
    }
    if (t < 0)
      break;

    passive[t] = true;
    bool fresh = true;

    while (true) {
      if (++iterations > max_iterations)
        throw SingularCorrectionMatrix("non-negative least squares did not converge");

      std::vector<Index> indices;
      for (Index j = 0; j < n; j++)
        if (passive[j]) indices.push_back(j);

      Eigen::MatrixXd a_passive(a.rows(), indices.size());
      for (size_t k = 0; k < indices.size(); k++)
        a_passive.col(k) = a.col(indices[k]);
      Eigen::VectorXd z_passive = a_passive.colPivHouseholderQr().solve(b);

      Eigen::VectorXd z = Eigen::VectorXd::Zero(n);
      for (size_t k = 0; k < indices.size(); k++)
        z(indices[k]) = z_passive(k);

      // a column that doesn't improve the fit numerically would be picked
      // again and again
      if (fresh && z(t) <= 0) {
        passive[t] = false;
        excluded[t] = true;
        break;
      }
      fresh = false;

      bool feasible = true;
      for (auto j : indices)
        if (z(j) <= 0) feasible = false;
      if (feasible) {
        x = z;
        break;
      }

      // move towards z as far as the constraints allow
      double alpha = std::numeric_limits<double>::infinity();
      Index blocking = -1;
      for (auto j : indices) {
        if (z(j) > 0) continue;
        double step = x(j) / (x(j) - z(j));
        if (step < alpha) {
          alpha = step;
          blocking = j;
        }
      }
      x += alpha * (z - x);
      x(blocking) = 0.0;
      for (auto j : indices) {
        if (x(j) <= tol) {
          x(j) = 0.0;
          passive[j] = false;
        }
      }
    }

    w = a.transpose() * (b - a * x);
  }

  return x.cwiseMax(0.0);
}

Solution solveCorrection(const CorrectionMatrix& m, const IntensityVector& observed) {
  if (observed.size() != m.size())
    throw DimensionMismatch(m.size(), observed.size());
  for (size_t i = 0; i < observed.size(); i++)
    if (!std::isfinite(observed[i]) || observed[i] < 0)
      throw InvalidIntensity(i, observed[i]);

  const auto& matrix = m.matrix();
  if (!matrix.allFinite() || (matrix.array() == 0.0).all())
    throw SingularCorrectionMatrix("correction matrix is zero or not finite");

  Eigen::MatrixXd a = matrix.transpose();
  Eigen::VectorXd v = Eigen::Map<const Eigen::VectorXd>(observed.data(), observed.size());

  // negative values of this magnitude are rounding noise
  const double noise = 1e-9 * (v.size() > 0 ? v.maxCoeff() : 0.0);

  Solution solution;
  solution.method = SolveMethod::exact;
  solution.clipped = 0;

  Eigen::VectorXd c;
  bool solved = false;
  Eigen::FullPivLU<Eigen::MatrixXd> lu(a);
  if (lu.isInvertible()) {
    c = lu.solve(v);
    solved = c.allFinite() && c.minCoeff() >= -noise;
  }

  if (!solved) {
    c = nonNegativeLeastSquares(a, v);
    solution.method = SolveMethod::nnls;
    if (!c.allFinite())
      throw SingularCorrectionMatrix("no non-negative solution exists");
  }

  solution.corrected.resize(c.size());
  for (Eigen::Index i = 0; i < c.size(); i++) {
    if (c(i) < 0) {
      solution.corrected[i] = 0.0;
      ++solution.clipped;
    } else {
      solution.corrected[i] = c(i);
    }
  }
  return solution;
}
}
