#ifndef KNNW_HYPERPLANE_HPP_
#define KNNW_HYPERPLANE_HPP_

#include <vector>

#include <Eigen/Dense>

namespace knnw {

/**
 * @brief Hyperplane sum_i coefficients[i] * v[i] + constant = 0
 */
struct hyperplane_t {
    std::vector<double> coefficients;
    double constant = 0.0;

    int n_dims() const { return static_cast<int>(coefficients.size()); }
};

/**
 * @brief Converts regression coefficients into a hyperplane of the input-output space
 *
 * For beta = [b0, b1, ..., bD] the hyperplane has coefficients
 * [b1, ..., bD, -1] over (x1, ..., xD, y) and constant b0, which is the
 * implicit form of y = b0 + sum_i bi * xi.
 *
 * @throws std::invalid_argument if beta has fewer than two entries
 */
hyperplane_t hyperplane_from_ols(const Eigen::VectorXd& beta);

/**
 * @brief Perpendicular distance from a point to a hyperplane
 *
 *   |sum_i c[i] * point[i] + constant| / sqrt(sum_i c[i]^2)
 *
 * @param point Array of plane.n_dims() coordinates
 *
 * @throws degenerate_hyperplane_error if the coefficient vector has zero
 *         (or non-finite) norm
 */
double point_hyperplane_distance(const double* point, const hyperplane_t& plane);

} // namespace knnw

#endif // KNNW_HYPERPLANE_HPP_
