#include "libnumopt/math/derivative.hpp"

#include <stdexcept>
#include <utility>

namespace numopt::diff {

CentralDifference::CentralDifference(Function f, double h)
    : f_(std::move(f)), h_(h)
{
    if (!f_) {
        throw std::invalid_argument("CentralDifference: empty function");
    }
    if (!(h_ > 0.0)) {
        throw std::invalid_argument("CentralDifference: step must be positive");
    }
}

double CentralDifference::operator()(double x) const {
    const double fp = f_(x + h_);
    const double fm = f_(x - h_);
    return (fp - fm) / (2.0 * h_);
}

Stencil central_stencil(const Function& f, double x, double h) {
    const double fm = f(x - h);
    const double f0 = f(x);
    const double fp = f(x + h);
    return { f0, 0.5 * (fp - fm) / h, (fp + fm - 2.0 * f0) / (h * h) };
}

} // namespace numopt::diff
