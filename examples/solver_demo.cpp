#include "libnumopt/math/root_finders.hpp"
#include "libnumopt/opt/golden_section.hpp"
#include "libnumopt/opt/nelder_mead.hpp"
#include "libnumopt/utils/logging.hpp"

#include <Eigen/Core>

#include <cmath>
#include <string>

namespace {

// e^x + sin(x)/x, continuous at 0
double fct(double x) {
    return (x != 0.0) ? std::sin(x) / x + std::exp(x) : 2.0;
}

double dfct(double x) {
    return (x != 0.0) ? std::exp(x) + std::cos(x) / x - std::sin(x) / (x * x) : 1.0;
}

double ddfct(double x) {
    if (x == 0.0) {
        return 2.0 / 3.0;
    }
    const double x2 = x * x;
    return std::exp(x) - (x2 - 2.0) * std::sin(x) / (x2 * x) - 2.0 * std::cos(x) / x2;
}

double rosenbrock(const Eigen::VectorXd& x) {
    return (1.0 - x[0]) * (1.0 - x[0]) + 100.0 * (x[1] - x[0] * x[0]) * (x[1] - x[0] * x[0]);
}

int check(const std::string& name, double x, double x_true, double tol) {
    const double diff = std::abs(x - x_true);
    if (diff < tol) {
        NUMOPT_INFO("{:<24} passed  x = {:.15g}  f(x) = {:.6e}", name, x, fct(x));
        return 1;
    }
    NUMOPT_WARN("{:<24} FAILED  x = {:.15g}  expected {:.15g} (delta {:.3e})", name, x, x_true, x - x_true);
    return 0;
}

int check(const std::string& name, const numopt::Outcome<double>& res, double x_true, double tol) {
    if (!res) {
        NUMOPT_WARN("{:<24} FAILED  {}", name, res.error().message);
        return 0;
    }
    return check(name, res.value(), x_true, tol);
}

void tally(const char* family, int passed, int total) {
    if (passed == total) {
        NUMOPT_INFO("{}: {}/{} passed", family, passed, total);
    } else {
        NUMOPT_WARN("{}: {}/{} passed", family, passed, total);
    }
}

} // namespace

int main() {
    numopt::utils::Logging::init(spdlog::level::info);

    const double x0 = 1.0;
    const double tol = 1e-10;
    const int max_iter = 100;
    const double h = 1e-6;

    // reference roots of fct, 30 significant digits
    const double root_near = -3.26650043678562449167148755288;
    const double root_far  = -6.27133405258685307845641527902;

    int passed = 0;
    passed += check("Newton", numopt::root::newton(fct, dfct, x0, tol, max_iter), root_near, tol);
    passed += check("Newton (numeric)", numopt::root::newton_num(fct, x0, tol, h, max_iter), root_near, tol);
    passed += check("Halley", numopt::root::halley(fct, dfct, ddfct, x0, tol, max_iter), root_far, tol);
    passed += check("Halley (numeric)", numopt::root::halley_num(fct, x0, tol, h, max_iter), root_far, tol);
    passed += check("Bisection", numopt::root::bisection(fct, -5.0, 1.0, tol), root_near, tol);
    passed += check("Secant", numopt::root::secant(fct, -1.0, 1.0, tol, max_iter), root_near, tol);
    passed += check("Ridder", numopt::root::ridder(fct, -5.0, 1.0, tol, max_iter), root_near, tol);
    tally("Root finders", passed, 7);

    const double argmin = -4.54295618675514754103476876324;
    passed = check("Golden section", numopt::opt::golden_section_minimize(fct, -7.0, -1.0, tol), argmin, tol * 1e2);
    tally("Line minimizers", passed, 1);

    Eigen::VectorXd start(2);
    start << 2.0, -1.0;
    const auto nm = numopt::opt::nelder_mead(rosenbrock, start, 0.1, tol, 1000);
    const bool nm_ok = (nm.x - Eigen::VectorXd::Ones(2)).norm() < 1e-4 && std::abs(nm.fx) < 1e-6;
    if (nm_ok) {
        NUMOPT_INFO("{:<24} passed  x = ({:.10f}, {:.10f})  f(x) = {:.3e}", "Nelder-Mead", nm.x[0], nm.x[1], nm.fx);
    } else {
        NUMOPT_WARN("{:<24} FAILED  x = ({:.10f}, {:.10f})  f(x) = {:.3e}", "Nelder-Mead", nm.x[0], nm.x[1], nm.fx);
    }
    tally("Simplex minimizers", nm_ok ? 1 : 0, 1);

    return 0;
}
