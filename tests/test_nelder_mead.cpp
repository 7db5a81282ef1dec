#include <catch2/catch_all.hpp>

#include "libnumopt/opt/nelder_mead.hpp"

#include <Eigen/Core>

#include <cmath>
#include <stdexcept>

using Catch::Approx;

namespace {

double rosenbrock(const Eigen::VectorXd& x) {
    const double a = 1.0 - x[0];
    const double b = x[1] - x[0] * x[0];
    return a * a + 100.0 * b * b;
}

Eigen::VectorXd vec2(double x, double y) {
    Eigen::VectorXd v(2);
    v << x, y;
    return v;
}

} // namespace

TEST_CASE("Nelder-Mead minimizes the Rosenbrock function", "[nelder-mead]") {
    const auto res = numopt::opt::nelder_mead(rosenbrock, vec2(2.0, -1.0), 0.1, 1e-10, 1000);

    REQUIRE((res.x - vec2(1.0, 1.0)).norm() < 1e-4);
    REQUIRE(std::abs(res.fx) < 1e-6);
    REQUIRE(res.fx == rosenbrock(res.x));
    REQUIRE(res.iterations <= 1000);
}

TEST_CASE("Nelder-Mead minimizes a shifted bowl in three dimensions", "[nelder-mead]") {
    Eigen::VectorXd centre(3);
    centre << 1.0, -2.0, 0.5;
    auto bowl = [&centre](const Eigen::VectorXd& x) { return (x - centre).squaredNorm(); };

    const auto res = numopt::opt::nelder_mead(bowl, Eigen::VectorXd::Zero(3), 0.5, 1e-12, 5000);
    REQUIRE((res.x - centre).norm() < 1e-4);
}

TEST_CASE("Nelder-Mead works in one dimension", "[nelder-mead][edge]") {
    auto f = [](const Eigen::VectorXd& x) { return (x[0] - 3.0) * (x[0] - 3.0); };
    Eigen::VectorXd x0(1);
    x0 << 0.0;

    const auto res = numopt::opt::nelder_mead(f, x0, 1.0, 1e-10, 1000);
    REQUIRE(res.x.size() == 1);
    REQUIRE(res.x[0] == Approx(3.0).margin(1e-4));
}

TEST_CASE("Nelder-Mead stops at once on a flat objective", "[nelder-mead][edge]") {
    auto flat = [](const Eigen::VectorXd&) { return 1.0; };
    const auto res = numopt::opt::nelder_mead(flat, vec2(0.3, -0.7), 0.1, 1e-10, 100);

    REQUIRE(res.iterations == 0);
    REQUIRE(res.x == vec2(0.3, -0.7));
    REQUIRE(res.fx == 1.0);
}

TEST_CASE("Nelder-Mead returns the best vertex silently when the budget runs out", "[nelder-mead][edge]") {
    const Eigen::VectorXd x0 = vec2(2.0, -1.0);
    numopt::opt::NelderMeadResult res;
    REQUIRE_NOTHROW(res = numopt::opt::nelder_mead(rosenbrock, x0, 0.1, 1e-10, 5));

    REQUIRE(res.iterations == 5);
    REQUIRE(std::isfinite(res.fx));
    REQUIRE(res.fx <= rosenbrock(x0));
    REQUIRE(res.fx == rosenbrock(res.x));
}

TEST_CASE("Nelder-Mead shrinks when the contraction does not improve", "[nelder-mead][edge]") {
    // a spike at 0.05 defeats the first contraction of the simplex {0, 0.1}
    int spike_hits = 0;
    auto f = [&spike_hits](const Eigen::VectorXd& x) {
        if (x[0] == 0.05) {
            ++spike_hits;
            return 1.0;
        }
        return x[0] * x[0];
    };
    Eigen::VectorXd x0(1);
    x0 << 0.0;

    const auto res = numopt::opt::nelder_mead(f, x0, 0.1, 1e-10, 200);

    // once as the contraction point, once as the shrunk vertex
    REQUIRE(spike_hits >= 2);
    REQUIRE(res.fx == 0.0);
    REQUIRE(res.x[0] == 0.0);
}

TEST_CASE("Nelder-Mead stops once the simplex collapses even if values stay apart", "[nelder-mead][edge]") {
    // steep enough that the vertex values never agree to within tol
    auto steep = [](const Eigen::VectorXd& x) { return 1e20 * std::abs(x[0]); };
    Eigen::VectorXd x0(1);
    x0 << 1.0;

    const int max_iter = 1000;
    const auto res = numopt::opt::nelder_mead(steep, x0, 0.1, 1e-10, max_iter);

    REQUIRE(res.iterations < max_iter);
    REQUIRE(std::abs(res.x[0]) < 1e-9);
    REQUIRE(res.fx > 1e-10);
}

TEST_CASE("Nelder-Mead config overload matches the positional call", "[nelder-mead]") {
    numopt::opt::NelderMeadConfig cfg;
    cfg.simplex_size = 0.1;
    cfg.tol = 1e-10;
    cfg.max_iter = 1000;

    const auto a = numopt::opt::nelder_mead(rosenbrock, vec2(2.0, -1.0), cfg);
    const auto b = numopt::opt::nelder_mead(rosenbrock, vec2(2.0, -1.0), 0.1, 1e-10, 1000);
    REQUIRE(a.x == b.x);
    REQUIRE(a.fx == b.fx);
    REQUIRE(a.iterations == b.iterations);
}

TEST_CASE("Nelder-Mead is deterministic and verbose mode does not change it", "[nelder-mead]") {
    const auto quiet = numopt::opt::nelder_mead(rosenbrock, vec2(-1.2, 1.0), 0.1, 1e-10, 50);
    const auto again = numopt::opt::nelder_mead(rosenbrock, vec2(-1.2, 1.0), 0.1, 1e-10, 50);
    const auto loud = numopt::opt::nelder_mead(rosenbrock, vec2(-1.2, 1.0), 0.1, 1e-10, 50, true);

    REQUIRE(quiet.x == again.x);
    REQUIRE(quiet.fx == again.fx);
    REQUIRE(quiet.x == loud.x);
    REQUIRE(quiet.fx == loud.fx);
}

TEST_CASE("Nelder-Mead rejects bad parameters", "[nelder-mead][edge]") {
    REQUIRE_THROWS_AS(numopt::opt::nelder_mead(rosenbrock, Eigen::VectorXd(), 0.1, 1e-10, 10),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(numopt::opt::nelder_mead(rosenbrock, vec2(0.0, 0.0), 0.0, 1e-10, 10),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(numopt::opt::nelder_mead(rosenbrock, vec2(0.0, 0.0), 0.1, 0.0, 10),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(numopt::opt::nelder_mead(rosenbrock, vec2(0.0, 0.0), 0.1, 1e-10, 0),
                      std::invalid_argument);
}
