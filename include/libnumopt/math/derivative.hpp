#pragma once

#include <functional>

namespace numopt::diff {

using Function = std::function<double(double)>;

// First derivative by central difference: (f(x+h) - f(x-h)) / (2h).
// Stands in for an analytic derivative wherever one is expected.
class CentralDifference {
public:
    CentralDifference(Function f, double h);

    double operator()(double x) const;

    double step() const { return h_; }

private:
    Function f_;
    double h_;
};

struct Stencil {
    double value;
    double first;
    double second;
};

// Samples f at x-h, x and x+h (three evaluations) and returns f(x) together
// with the central first- and second-derivative estimates.
Stencil central_stencil(const Function& f, double x, double h);

} // namespace numopt::diff
