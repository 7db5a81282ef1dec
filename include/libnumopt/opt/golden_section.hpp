#pragma once

#include <functional>

namespace numopt::opt {

// Minimizes f on [a, b] by golden-section search. f must be unimodal on the
// interval; otherwise a local minimum (or an endpoint) is returned.
// The iteration count is fixed up front so the final bracket is below tol.
double golden_section_minimize(const std::function<double(double)>& f,
                               double a, double b, double tol = 1e-10);

} // namespace numopt::opt
