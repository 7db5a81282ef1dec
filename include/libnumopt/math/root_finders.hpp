#pragma once

#include "libnumopt/core/outcome.hpp"

#include <functional>

namespace numopt::root {

using Function = std::function<double(double)>;

// Newton's method. Stops once |f(x)/f'(x)| < tol. Where f'(x) is exactly zero
// the step is f(x) itself. Running out of iterations is not reported: the
// last iterate comes back either way, so check |f(x)| if it matters.
double newton(const Function& f, const Function& df, double x0,
              double tol = 1e-10, int max_iter = 100);

// Newton's method with f' replaced by a central difference of step h.
double newton_num(const Function& f, double x0,
                  double tol = 1e-10, double h = 1e-6, int max_iter = 100);

// Halley's method. Converged once |f(x)| < tol; NonConvergence otherwise.
Outcome<double> halley(const Function& f, const Function& df, const Function& d2f, double x0,
                       double tol = 1e-10, int max_iter = 100, bool verbose = false);

// Halley's method with f' and f'' estimated from f(x-h), f(x), f(x+h).
Outcome<double> halley_num(const Function& f, double x0,
                           double tol = 1e-10, double h = 1e-6, int max_iter = 100,
                           bool verbose = false);

// Bisection on [a, b] with ceil(log2((b-a)/tol)) halvings. Returns
// InvalidBracket as soon as neither half shows a sign change. The endpoints
// must be finite; their difference may exceed the largest double.
Outcome<double> bisection(const Function& f, double a, double b, double tol = 1e-10);

// Secant iteration from the two estimates a and b; no bracket is required.
// Not guaranteed to converge and never reports failure.
double secant(const Function& f, double a, double b, double tol = 1e-10, int max_iter = 100);

// Ridder's method on a sign-change bracket [a, b] with finite endpoints.
Outcome<double> ridder(const Function& f, double a, double b,
                       double tol = 1e-10, int max_iter = 100);

} // namespace numopt::root
