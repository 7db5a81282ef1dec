#include "libnumopt/opt/golden_section.hpp"

#include "libnumopt/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace numopt::opt {

namespace {

const double INV_PHI  = (std::sqrt(5.0) - 1.0) / 2.0;  // 1/phi
const double INV_PHI2 = (3.0 - std::sqrt(5.0)) / 2.0;  // 1/phi^2

// Enough reductions to take any finite bracket down to the smallest positive tolerance.
constexpr double MAX_REDUCTIONS = 3100.0;

} // namespace

double golden_section_minimize(const std::function<double(double)>& f,
                               double a, double b, double tol) {
    if (!f) {
        throw std::invalid_argument("golden_section_minimize: empty function");
    }
    if (!(tol > 0.0)) {
        throw std::invalid_argument("golden_section_minimize: tolerance must be positive");
    }
    if (!std::isfinite(a) || !std::isfinite(b)) {
        throw std::invalid_argument("golden_section_minimize: bracket endpoints must be finite");
    }

    if (a > b) {
        std::swap(a, b);
    }
    // half width, finite even where b - a overflows
    double r = 0.5 * b - 0.5 * a;
    if (r <= 0.5 * tol) {
        return 0.5 * a + 0.5 * b;
    }

    const double steps = std::ceil((std::log(tol) - std::log(2.0) - std::log(r)) / std::log(INV_PHI));
    const int n = (steps > 0.0) ? static_cast<int>(std::min(steps, MAX_REDUCTIONS)) : 0;

    double c = a + 2.0 * (INV_PHI2 * r);
    double d = a + 2.0 * (INV_PHI * r);
    double yc = f(c);
    double yd = f(d);

    auto& logger = utils::Logging::getLogger();
    for (int i = 0; i < n; ++i) {
        // one of the two probes is carried over, only the other is evaluated
        if (yc < yd) {
            b = d;
            d = c;
            yd = yc;
            r *= INV_PHI;
            c = a + 2.0 * (INV_PHI2 * r);
            yc = f(c);
        } else {
            a = c;
            c = d;
            yc = yd;
            r *= INV_PHI;
            d = a + 2.0 * (INV_PHI * r);
            yd = f(d);
        }
        if (logger->should_log(spdlog::level::trace)) {
            logger->trace("golden_section: iter={}/{} bracket=[{}, {}]", i, n, a, b);
        }
    }

    return (yc < yd) ? 0.5 * a + 0.5 * d : 0.5 * c + 0.5 * b;
}

} // namespace numopt::opt
