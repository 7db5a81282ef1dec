#include "libnumopt/opt/nelder_mead.hpp"

#include "libnumopt/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace numopt::opt {

namespace {

constexpr double ALPHA = 1.0;  // reflection
constexpr double GAMMA = 2.0;  // expansion
constexpr double RHO   = 0.5;  // contraction
constexpr double SIGMA = 0.5;  // shrink

struct Vertex {
    Eigen::VectorXd x;
    double f;
};

using Simplex = std::vector<Vertex>;

// NaN values rank last.
bool ranks_before(const Vertex& lhs, const Vertex& rhs) {
    if (std::isnan(lhs.f)) {
        return false;
    }
    if (std::isnan(rhs.f)) {
        return true;
    }
    return lhs.f < rhs.f;
}

Simplex sorted(Simplex simplex) {
    std::stable_sort(simplex.begin(), simplex.end(), ranks_before);
    return simplex;
}

double value_spread(const Simplex& simplex) {
    const double n = static_cast<double>(simplex.size());
    double mean = 0.0;
    for (const auto& v : simplex) mean += v.f;
    mean /= n;
    double sum = 0.0;
    for (const auto& v : simplex) sum += (v.f - mean) * (v.f - mean);
    return std::sqrt(sum / n);
}

// Sum of distances over ordered pairs i != j, divided by (n+1)^2.
double mean_edge_length(const Simplex& simplex) {
    const std::size_t n = simplex.size();
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < n; ++j) {
            if (i != j) {
                sum += (simplex[i].x - simplex[j].x).norm();
            }
        }
    }
    return sum / static_cast<double>(n * n);
}

std::string describe(const Eigen::VectorXd& v) {
    static const Eigen::IOFormat style(Eigen::FullPrecision, Eigen::DontAlignCols,
                                     ", ", ", ", "", "", "[", "]");
    std::ostringstream oss;
    oss << v.transpose().format(style);
    return oss.str();
}

void log_simplex(spdlog::logger& logger, spdlog::level::level_enum level, const Simplex& simplex) {
    if (!logger.should_log(level)) {
        return;
    }
    for (const auto& v : simplex) {
        logger.log(level, "  {} -> {}", describe(v.x), v.f);
    }
}

} // namespace

NelderMeadResult nelder_mead(const VectorFunction& f,
                             const Eigen::VectorXd& x0,
                             double simplex_size,
                             double tol,
                             int max_iter,
                             bool verbose) {
    if (!f) {
        throw std::invalid_argument("nelder_mead: empty function");
    }
    if (x0.size() == 0) {
        throw std::invalid_argument("nelder_mead: initial point has no dimensions");
    }
    if (!(simplex_size > 0.0)) {
        throw std::invalid_argument("nelder_mead: simplex size must be positive");
    }
    if (!(tol > 0.0)) {
        throw std::invalid_argument("nelder_mead: tolerance must be positive");
    }
    if (max_iter <= 0) {
        throw std::invalid_argument("nelder_mead: max_iter must be positive");
    }

    auto& logger = *utils::Logging::getLogger();
    const auto level = verbose ? spdlog::level::info : spdlog::level::trace;

    const Eigen::Index dim = x0.size();
    Simplex simplex;
    simplex.reserve(static_cast<std::size_t>(dim) + 1);
    simplex.push_back({x0, f(x0)});
    for (Eigen::Index i = 0; i < dim; ++i) {
        Eigen::VectorXd x = x0;
        x[i] += simplex_size;
        const double fx = f(x);
        simplex.push_back({std::move(x), fx});
    }

    logger.log(level, "nelder_mead: initial simplex");
    log_simplex(logger, level, simplex);

    const std::size_t worst = simplex.size() - 1;
    const std::size_t second_worst = worst - 1;

    for (int iter = 0; iter < max_iter; ++iter) {
        simplex = sorted(std::move(simplex));

        logger.log(level, "nelder_mead: iteration {}, sorted simplex", iter);
        log_simplex(logger, level, simplex);

        if (value_spread(simplex) < tol) {
            logger.log(level, "nelder_mead: converged on function values after {} iterations", iter);
            return {simplex.front().x, simplex.front().f, iter};
        }
        if (mean_edge_length(simplex) < tol) {
            logger.log(level, "nelder_mead: converged on simplex size after {} iterations", iter);
            return {simplex.front().x, simplex.front().f, iter};
        }

        Eigen::VectorXd centroid = Eigen::VectorXd::Zero(dim);
        for (std::size_t i = 0; i < worst; ++i) {
            centroid += simplex[i].x;
        }
        centroid /= static_cast<double>(worst);
        if (logger.should_log(level)) {
            logger.log(level, "nelder_mead: centroid {}", describe(centroid));
        }

        Eigen::VectorXd reflection = centroid + ALPHA * (centroid - simplex[worst].x);
        const double f_reflection = f(reflection);
        if (logger.should_log(level)) {
            logger.log(level, "nelder_mead: reflection {} -> {}", describe(reflection), f_reflection);
        }

        if (simplex.front().f <= f_reflection && f_reflection < simplex[second_worst].f) {
            simplex[worst] = {std::move(reflection), f_reflection};
            continue;
        }

        if (f_reflection < simplex.front().f) {
            Eigen::VectorXd expansion = centroid + GAMMA * (reflection - centroid);
            const double f_expansion = f(expansion);
            if (logger.should_log(level)) {
                logger.log(level, "nelder_mead: expansion {} -> {}", describe(expansion), f_expansion);
            }
            if (f_expansion <= f_reflection) {
                simplex[worst] = {std::move(expansion), f_expansion};
            } else {
                simplex[worst] = {std::move(reflection), f_reflection};
            }
            continue;
        }

        // f_reflection >= second worst (or NaN)
        Eigen::VectorXd contraction = centroid + RHO * (simplex[worst].x - centroid);
        const double f_contraction = f(contraction);
        if (logger.should_log(level)) {
            logger.log(level, "nelder_mead: contraction {} -> {}", describe(contraction), f_contraction);
        }
        if (f_contraction < simplex[worst].f) {
            simplex[worst] = {std::move(contraction), f_contraction};
            continue;
        }

        logger.log(level, "nelder_mead: shrinking the simplex towards the best vertex");
        const Eigen::VectorXd best = simplex.front().x;
        for (std::size_t i = 1; i < simplex.size(); ++i) {
            simplex[i].x = best + SIGMA * (simplex[i].x - best);
            simplex[i].f = f(simplex[i].x);
        }
    }

    simplex = sorted(std::move(simplex));
    logger.log(verbose ? spdlog::level::info : spdlog::level::debug,
               "nelder_mead: budget of {} iterations exhausted, best value {}", max_iter, simplex.front().f);
    return {simplex.front().x, simplex.front().f, max_iter};
}

NelderMeadResult nelder_mead(const VectorFunction& f,
                             const Eigen::VectorXd& x0,
                             const NelderMeadConfig& cfg) {
    return nelder_mead(f, x0, cfg.simplex_size, cfg.tol, cfg.max_iter, cfg.verbose);
}

} // namespace numopt::opt
