#include "knnw/ols.hpp"
#include "knnw/weighting_errors.hpp"

#include <cmath>
#include <string>
#include <stdexcept>

namespace knnw {

eigen_ols_solver_t::eigen_ols_solver_t(double rank_threshold)
    : rank_threshold_(rank_threshold) {
    if (!std::isfinite(rank_threshold) || rank_threshold <= 0.0 || rank_threshold >= 1.0) {
        throw std::invalid_argument("eigen_ols_solver_t: rank threshold must be in (0, 1)");
    }
}

/**
 * @brief Fits y ~ b0 + X b by least squares
 *
 * @param y Response vector of length n
 * @param X Regressors, n rows by D columns, without intercept column
 *
 * @return ols_fit_t with D + 1 coefficients, intercept first
 *
 * @throws std::invalid_argument if y and X disagree on the number of rows or D < 1
 * @throws rank_deficient_error if n <= D, if [1 | X] has rank below D + 1,
 *         or if the solution is not finite
 */
ols_fit_t eigen_ols_solver_t::fit(const Eigen::VectorXd& y, const Eigen::MatrixXd& X) const {
    const Eigen::Index n = X.rows();
    const Eigen::Index d = X.cols();

    if (y.size() != n) {
        throw std::invalid_argument("ols fit: response has " + std::to_string(y.size()) +
                                    " rows but design matrix has " + std::to_string(n));
    }
    if (d < 1) {
        throw std::invalid_argument("ols fit: design matrix has no regressors");
    }

    // Mirrors the classical "not enough data for this many predictors" check
    if (n <= d) {
        throw rank_deficient_error(std::to_string(n) + " observations for " +
                                   std::to_string(d) + " regressors plus intercept");
    }

    Eigen::MatrixXd design(n, d + 1);
    design.col(0).setOnes();
    design.rightCols(d) = X;

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
    qr.setThreshold(rank_threshold_);

    if (qr.rank() < d + 1) {
        throw rank_deficient_error("design matrix rank " + std::to_string(qr.rank()) +
                                   " is below the " + std::to_string(d + 1) + " unknowns");
    }

    ols_fit_t result;
    result.beta = qr.solve(y);
    result.rank = static_cast<int>(qr.rank());

    if (!result.beta.allFinite()) {
        throw rank_deficient_error("non-finite regression coefficients");
    }

    return result;
}

} // namespace knnw
