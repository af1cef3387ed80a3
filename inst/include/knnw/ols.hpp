#ifndef KNNW_OLS_HPP_
#define KNNW_OLS_HPP_

#include <Eigen/Dense>

namespace knnw {

/**
 * @brief Ordinary least squares fit with intercept
 *
 * beta(0) is the intercept and beta(1..D) are the slopes of the D regressors.
 */
struct ols_fit_t {
    Eigen::VectorXd beta;
    int rank = 0;        ///< numerical rank of the design matrix [1 | X]
};

/**
 * @brief Regression collaborator used by the nonlinearity scheme
 *
 * Implementations receive the response y (n) and the regressors X (n x D)
 * without an intercept column and must return D + 1 coefficients, intercept
 * first. A sample that cannot identify all coefficients must be reported by
 * throwing knnw::rank_deficient_error, never by returning a partial fit.
 */
class ols_solver_t {
public:
    virtual ~ols_solver_t() = default;
    virtual ols_fit_t fit(const Eigen::VectorXd& y, const Eigen::MatrixXd& X) const = 0;
};

/**
 * @brief Default OLS solver based on column-pivoting Householder QR
 *
 * The rank of [1 | X] is compared against D + 1 using a relative pivot
 * threshold; samples with n <= D rows are rejected before factorization.
 */
class eigen_ols_solver_t : public ols_solver_t {
public:
    explicit eigen_ols_solver_t(double rank_threshold = 1e-10);

    ols_fit_t fit(const Eigen::VectorXd& y, const Eigen::MatrixXd& X) const override;

    double rank_threshold() const { return rank_threshold_; }

private:
    double rank_threshold_;
};

} // namespace knnw

#endif // KNNW_OLS_HPP_
