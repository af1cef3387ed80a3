#include "knnw/distance.hpp"

#include <cmath>
#include <string>
#include <stdexcept>

namespace knnw {

void validate_dist_metric(double z) {
    if (!std::isfinite(z) || z <= 0.0) {
        throw std::invalid_argument("distance metric exponent must be finite and > 0, got " +
                                    std::to_string(z));
    }
}

double minkowski_distance(const double* p, const double* q, int n_dims, double z) {
    validate_dist_metric(z);
    if (n_dims < 0) {
        throw std::invalid_argument("minkowski_distance(): negative number of dimensions");
    }

    double sum = 0.0;
    if (z == 1.0) {
        for (int i = 0; i < n_dims; ++i) sum += std::fabs(p[i] - q[i]);
        return sum;
    }

    // Terms are scaled into [0, 1] by the largest component difference
    double max_diff = 0.0;
    for (int i = 0; i < n_dims; ++i) {
        const double diff = std::fabs(p[i] - q[i]);
        if (diff > max_diff || std::isnan(diff)) max_diff = diff;
    }
    if (max_diff == 0.0 || !std::isfinite(max_diff)) {
        return max_diff;
    }

    if (z == 2.0) {
        for (int i = 0; i < n_dims; ++i) {
            const double ratio = (p[i] - q[i]) / max_diff;
            sum += ratio * ratio;
        }
        return max_diff * std::sqrt(sum);
    }

    for (int i = 0; i < n_dims; ++i) {
        sum += std::pow(std::fabs(p[i] - q[i]) / max_diff, z);
    }
    return max_diff * std::pow(sum, 1.0 / z);
}

} // namespace knnw
