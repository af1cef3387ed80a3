#include "knnw/hyperplane.hpp"
#include "knnw/weighting_errors.hpp"

#include <cmath>
#include <string>
#include <stdexcept>

namespace knnw {

hyperplane_t hyperplane_from_ols(const Eigen::VectorXd& beta) {
    if (beta.size() < 2) {
        throw std::invalid_argument("hyperplane_from_ols(): need an intercept and at least one slope");
    }

    const int n_inputs = static_cast<int>(beta.size()) - 1;

    hyperplane_t plane;
    plane.coefficients.resize(n_inputs + 1);
    for (int i = 0; i < n_inputs; ++i) {
        plane.coefficients[i] = beta(i + 1);
    }
    plane.coefficients[n_inputs] = -1.0;  // output axis
    plane.constant = beta(0);

    return plane;
}

double point_hyperplane_distance(const double* point, const hyperplane_t& plane) {
    double num = plane.constant;
    double norm_sq = 0.0;
    for (int i = 0; i < plane.n_dims(); ++i) {
        num += plane.coefficients[i] * point[i];
        norm_sq += plane.coefficients[i] * plane.coefficients[i];
    }

    const double norm = std::sqrt(norm_sq);
    if (!std::isfinite(norm) || norm <= 0.0) {
        throw degenerate_hyperplane_error("coefficient vector has norm " + std::to_string(norm));
    }

    return std::fabs(num) / norm;
}

} // namespace knnw
