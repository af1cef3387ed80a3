#ifndef KNNW_DISTANCE_HPP_
#define KNNW_DISTANCE_HPP_

namespace knnw {

/**
 * @brief Throws std::invalid_argument unless z is finite and strictly positive
 */
void validate_dist_metric(double z);

/**
 * @brief Parameterized Minkowski distance over the first n_dims components
 *
 *   d(p, q) = ( sum_{i < n_dims} |p[i] - q[i]|^z )^(1/z)
 *
 * z = 1 gives the Manhattan distance, z = 2 the Euclidean distance and
 * 0 < z < 1 the fractional distance, which is not a metric but is accepted.
 *
 * @throws std::invalid_argument if z is not finite and positive or n_dims < 0
 */
double minkowski_distance(const double* p, const double* q, int n_dims, double z);

} // namespace knnw

#endif // KNNW_DISTANCE_HPP_
