#pragma once

#include <Eigen/Core>

#include <functional>

namespace numopt::opt {

using VectorFunction = std::function<double(const Eigen::VectorXd&)>;

struct NelderMeadConfig {
    double simplex_size = 0.1;
    double tol = 1e-10;
    int max_iter = 1000;
    bool verbose = false;
};

struct NelderMeadResult {
    Eigen::VectorXd x;
    double fx = 0.0;
    int iterations = 0;
};

/**
 * Derivative-free minimization with the Nelder-Mead simplex
 * (reflection 1, expansion 2, contraction 0.5, shrink 0.5).
 *
 * The initial simplex is x0 plus x0 + simplex_size * e_i for each axis.
 * Stops when the standard deviation of the vertex values, or the mean
 * distance between vertices, drops below tol. Running out of iterations is
 * not reported; the best vertex seen is returned either way.
 *
 * verbose raises the per-iteration log records from trace to info.
 */
NelderMeadResult nelder_mead(const VectorFunction& f,
                             const Eigen::VectorXd& x0,
                             double simplex_size,
                             double tol,
                             int max_iter,
                             bool verbose = false);

NelderMeadResult nelder_mead(const VectorFunction& f,
                             const Eigen::VectorXd& x0,
                             const NelderMeadConfig& cfg = {});

} // namespace numopt::opt
