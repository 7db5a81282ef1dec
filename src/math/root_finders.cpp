#include "libnumopt/math/root_finders.hpp"

#include "libnumopt/math/derivative.hpp"
#include "libnumopt/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace numopt::root {

namespace {

// Halvings that take any finite bracket down to the smallest positive tolerance.
constexpr double MAX_HALVINGS = 2100.0;

// Evaluates f, f' and f'' at one point.
using SecondOrderEval = std::function<void(double, double&, double&, double&)>;

void require_callable(const Function& f, const char* who) {
    if (!f) {
        throw std::invalid_argument(std::string(who) + ": empty function");
    }
}

void require_tolerance(double tol, const char* who) {
    if (!(tol > 0.0)) {
        throw std::invalid_argument(std::string(who) + ": tolerance must be positive");
    }
}

void require_budget(int max_iter, const char* who) {
    if (max_iter <= 0) {
        throw std::invalid_argument(std::string(who) + ": max_iter must be positive");
    }
}

void require_step(double h, const char* who) {
    if (!(h > 0.0)) {
        throw std::invalid_argument(std::string(who) + ": finite-difference step must be positive");
    }
}

void require_finite_bracket(double a, double b, const char* who) {
    if (!std::isfinite(a) || !std::isfinite(b)) {
        throw std::invalid_argument(std::string(who) + ": bracket endpoints must be finite");
    }
}

// Zero and NaN have no sign here.
bool opposite_signs(double u, double v) {
    return (u < 0.0 && v > 0.0) || (u > 0.0 && v < 0.0);
}

Outcome<double> fail(ErrorKind kind, const std::string& message) {
    utils::Logging::getLogger()->debug(message);
    return Outcome<double>::failure(kind, message);
}

Outcome<double> halley_iterate(const char* who, const SecondOrderEval& eval,
                               double x0, double tol, int max_iter, bool verbose) {
    auto& logger = utils::Logging::getLogger();
    const auto level = verbose ? spdlog::level::info : spdlog::level::trace;

    double x = x0;
    double fx = 0.0, dfx = 0.0, d2fx = 0.0;
    for (int i = 0; i < max_iter; ++i) {
        eval(x, fx, dfx, d2fx);
        logger->log(level, "{}: iter={} x={} f(x)={}", who, i, x, fx);
        if (std::abs(fx) < tol) {
            return Outcome<double>::success(x);
        }
        x -= 2.0 * fx * dfx / (2.0 * dfx * dfx - fx * d2fx);
    }

    std::ostringstream oss;
    oss << who << ": no convergence after " << max_iter << " iterations"
        << " (x=" << x << ", last |f(x)|=" << std::abs(fx) << ", tol=" << tol << ")";
    return fail(ErrorKind::NonConvergence, oss.str());
}

} // namespace

double newton(const Function& f, const Function& df, double x0, double tol, int max_iter) {
    require_callable(f, "newton");
    require_callable(df, "newton");
    require_tolerance(tol, "newton");
    require_budget(max_iter, "newton");

    auto& logger = utils::Logging::getLogger();
    double x = x0;
    for (int i = 0; i < max_iter; ++i) {
        const double fx = f(x);
        const double dfx = df(x);
        double step = 0.0;
        if (dfx == 0.0) {
            logger->debug("newton: zero derivative at x={}, stepping by f(x)={}", x, fx);
            step = fx;
        } else {
            step = fx / dfx;
        }
        x -= step;
        if (logger->should_log(spdlog::level::trace)) {
            logger->trace("newton: iter={} x={} step={}", i, x, step);
        }
        if (std::abs(step) < tol) {
            return x;
        }
    }
    logger->debug("newton: budget of {} iterations exhausted, returning x={}", max_iter, x);
    return x;
}

double newton_num(const Function& f, double x0, double tol, double h, int max_iter) {
    require_callable(f, "newton_num");
    require_step(h, "newton_num");
    return newton(f, diff::CentralDifference(f, h), x0, tol, max_iter);
}

Outcome<double> halley(const Function& f, const Function& df, const Function& d2f, double x0,
                       double tol, int max_iter, bool verbose) {
    require_callable(f, "halley");
    require_callable(df, "halley");
    require_callable(d2f, "halley");
    require_tolerance(tol, "halley");
    require_budget(max_iter, "halley");

    auto eval = [&](double x, double& fx, double& dfx, double& d2fx) {
        fx = f(x);
        dfx = df(x);
        d2fx = d2f(x);
    };
    return halley_iterate("halley", eval, x0, tol, max_iter, verbose);
}

Outcome<double> halley_num(const Function& f, double x0, double tol, double h, int max_iter,
                           bool verbose) {
    require_callable(f, "halley_num");
    require_tolerance(tol, "halley_num");
    require_step(h, "halley_num");
    require_budget(max_iter, "halley_num");

    auto eval = [&](double x, double& fx, double& dfx, double& d2fx) {
        const diff::Stencil s = diff::central_stencil(f, x, h);
        fx = s.value;
        dfx = s.first;
        d2fx = s.second;
    };
    return halley_iterate("halley_num", eval, x0, tol, max_iter, verbose);
}

Outcome<double> bisection(const Function& f, double a, double b, double tol) {
    require_callable(f, "bisection");
    require_tolerance(tol, "bisection");
    require_finite_bracket(a, b, "bisection");

    if (a > b) {
        std::swap(a, b);
    }
    double fa = f(a);
    double fb = f(b);
    if (fa == 0.0) {
        return Outcome<double>::success(a);
    }
    if (fb == 0.0) {
        return Outcome<double>::success(b);
    }

    // half width, finite even where b - a overflows
    const double r = 0.5 * b - 0.5 * a;
    int n = 0;
    if (r > 0.5 * tol) {
        const double steps = std::ceil(std::log2(r) + 1.0 - std::log2(tol));
        n = static_cast<int>(std::min(steps, MAX_HALVINGS));
    }

    auto& logger = utils::Logging::getLogger();
    for (int i = 0; i < n; ++i) {
        const double c = 0.5 * a + 0.5 * b;
        const double fc = f(c);
        if (fc == 0.0) {
            return Outcome<double>::success(c);
        }
        if (opposite_signs(fa, fc)) {
            b = c;
            fb = fc;
        } else if (opposite_signs(fc, fb)) {
            a = c;
            fa = fc;
        } else {
            std::ostringstream oss;
            oss << "bisection: no sign change in [" << a << ", " << b << "]"
                << " (f(a)=" << fa << ", f(mid)=" << fc << ", f(b)=" << fb << ")";
            return fail(ErrorKind::InvalidBracket, oss.str());
        }
        if (logger->should_log(spdlog::level::trace)) {
            logger->trace("bisection: iter={}/{} bracket=[{}, {}]", i, n, a, b);
        }
    }
    return Outcome<double>::success(0.5 * a + 0.5 * b);
}

double secant(const Function& f, double a, double b, double tol, int max_iter) {
    require_callable(f, "secant");
    require_tolerance(tol, "secant");
    require_budget(max_iter, "secant");

    auto& logger = utils::Logging::getLogger();
    double fa = f(a);
    double fb = f(b);
    for (int i = 0; i < max_iter; ++i) {
        // unguarded: fa == fb gives inf/nan and the iteration never recovers
        const double c = a - fa * (a - b) / (fa - fb);
        a = b;
        fa = fb;
        b = c;
        fb = f(b);
        if (logger->should_log(spdlog::level::trace)) {
            logger->trace("secant: iter={} x={} f(x)={}", i, b, fb);
        }
        if (std::abs(b - a) < tol) {
            return b;
        }
    }
    logger->debug("secant: budget of {} iterations exhausted, returning x={}", max_iter, b);
    return b;
}

Outcome<double> ridder(const Function& f, double a, double b, double tol, int max_iter) {
    require_callable(f, "ridder");
    require_tolerance(tol, "ridder");
    require_finite_bracket(a, b, "ridder");
    require_budget(max_iter, "ridder");

    double fa = f(a);
    double fb = f(b);
    if (fa == 0.0) {
        return Outcome<double>::success(a);
    }
    if (fb == 0.0) {
        return Outcome<double>::success(b);
    }
    if (!opposite_signs(fa, fb)) {
        std::ostringstream oss;
        oss << "ridder: root not bracketed by [" << a << ", " << b << "]"
            << " (f(a)=" << fa << ", f(b)=" << fb << ")";
        return fail(ErrorKind::InvalidBracket, oss.str());
    }

    auto& logger = utils::Logging::getLogger();
    double x_prev = 0.0;
    for (int i = 0; i < max_iter; ++i) {
        const double c = 0.5 * a + 0.5 * b;
        const double fc = f(c);
        const double s = std::sqrt(fc * fc - fa * fb);

        double x = 0.0;
        if (s == 0.0) {
            x = c + (c - a) * fc / (fa - fb);
        } else {
            const double dir = (fa > fb) ? 1.0 : -1.0;
            x = c + dir * (c - a) * fc / s;
        }
        if (logger->should_log(spdlog::level::trace)) {
            logger->trace("ridder: iter={} bracket=[{}, {}] x={}", i, a, b, x);
        }
        if (i > 0 && std::abs(x - x_prev) <= tol * std::max(std::abs(x), 1.0)) {
            return Outcome<double>::success(x);
        }
        x_prev = x;

        const double fx = f(x);
        if (fx == 0.0) {
            return Outcome<double>::success(x);
        }
        if (opposite_signs(fc, fx)) {
            a = c;
            fa = fc;
            b = x;
            fb = fx;
        } else if (opposite_signs(fa, fx)) {
            b = x;
            fb = fx;
        } else if (opposite_signs(fb, fx)) {
            a = x;
            fa = fx;
        } else {
            std::ostringstream oss;
            oss << "ridder: lost the sign change at x=" << x << " (f(x)=" << fx << ")";
            return fail(ErrorKind::InvalidBracket, oss.str());
        }
    }

    std::ostringstream oss;
    oss << "ridder: no convergence after " << max_iter << " iterations"
        << " (bracket=[" << a << ", " << b << "], x=" << x_prev << ")";
    return fail(ErrorKind::NonConvergence, oss.str());
}

} // namespace numopt::root
