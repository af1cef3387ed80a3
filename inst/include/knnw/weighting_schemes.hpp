#ifndef KNNW_WEIGHTING_SCHEMES_HPP_
#define KNNW_WEIGHTING_SCHEMES_HPP_

#include "dataset.hpp"
#include "ols.hpp"

#include <string>

namespace knnw {

/// Schemes that weigh a single instance. The remoteness composites are
/// resolved by the batch driver (see instance_weighting.hpp).
enum class weighting_scheme_t {
    proximity_x,
    proximity_xy,
    surrounding_x,
    surrounding_xy,
    nonlinearity
};

/// Vector space an instance is compared in.
enum class weighting_space_t {
    input,          ///< the D inputs
    input_output    ///< the D inputs followed by the output
};

/**
 * @brief Maps a scheme identifier ("proximity-x", ..., "nonlinearity") to the enum
 * @throws std::invalid_argument for any other identifier, including the
 *         remoteness composites
 */
weighting_scheme_t parse_weighting_scheme(const std::string& id);
const char* weighting_scheme_name(weighting_scheme_t scheme);

/// Space used by the scheme; nonlinearity always works in the input-output space.
weighting_space_t weighting_scheme_space(weighting_scheme_t scheme);

/// "x" or "xy"; throws std::invalid_argument otherwise.
weighting_space_t parse_weighting_space(const std::string& id);
const char* weighting_space_name(weighting_space_t space);

/**
 * @brief Validated scheme plus distance-metric exponent
 */
struct weighting_config_t {
    weighting_scheme_t scheme = weighting_scheme_t::proximity_x;
    double dist_metric = 2.0;
};

/**
 * @brief Builds a config from the loosely typed identifier and exponent
 * @throws std::invalid_argument for an unknown scheme or an exponent that is
 *         zero, negative or not finite
 */
weighting_config_t make_weighting_config(const std::string& scheme_id, double dist_metric);

/**
 * @brief Sum of the distances from the instance to each of its neighbors
 *
 * No division by the number of neighbors; weights are only compared
 * relative to each other.
 */
double proximity(const instance_view_t& inst, weighting_space_t space, double dist_metric);

/**
 * @brief Length of the resultant of the displacement vectors to the neighbors
 *
 * Neighbors on all sides cancel out and give a small weight; neighbors
 * concentrated on one side give a large one. The length is measured with the
 * same Minkowski exponent as the distances.
 */
double surrounding(const instance_view_t& inst, weighting_space_t space, double dist_metric);

/**
 * @brief Deviation of the instance from the least-squares hyperplane through
 *        the instance and its neighbors in the input-output space
 *
 * @throws rank_deficient_error if the k + 1 rows cannot identify the D + 1
 *         regression coefficients
 * @throws degenerate_hyperplane_error if the fitted plane has a zero-norm normal
 */
double nonlinearity(const instance_view_t& inst, const ols_solver_t& solver);

/**
 * @brief Weighs one instance with the configured scheme
 *
 * @throws std::invalid_argument if config.dist_metric is invalid
 * @throws weighting_error subclasses from the nonlinearity scheme
 */
double weigh_instance(const instance_view_t& inst,
                      const weighting_config_t& config,
                      const ols_solver_t& solver);

} // namespace knnw

#endif // KNNW_WEIGHTING_SCHEMES_HPP_
