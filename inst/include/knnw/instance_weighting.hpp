#ifndef KNNW_INSTANCE_WEIGHTING_HPP_
#define KNNW_INSTANCE_WEIGHTING_HPP_

#include "dataset.hpp"
#include "ols.hpp"
#include "weighting_schemes.hpp"

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace knnw {

/**
 * @brief Schemes applied over a whole dataset
 *
 * A single-scheme plan weighs every instance with primary. The remoteness
 * composites pair a proximity scheme (primary) with the surrounding scheme
 * of the same space (alternate); an alternation policy picks one per instance.
 */
struct scheme_plan_t {
    weighting_scheme_t primary = weighting_scheme_t::proximity_x;
    std::optional<weighting_scheme_t> alternate;

    bool is_composite() const { return alternate.has_value(); }
};

/// Accepts the five core identifiers plus "remoteness-x" and "remoteness-xy".
scheme_plan_t resolve_scheme_plan(const std::string& id);

/**
 * @brief Chooses between the two schemes of a composite plan
 *
 * use_alternate() is called once per instance, in increasing index order,
 * from a single thread before any weight is computed.
 */
class alternation_policy_t {
public:
    virtual ~alternation_policy_t() = default;
    virtual bool use_alternate(int instance_index) = 0;
};

/// Even instance indices use the primary scheme, odd ones the alternate.
class round_robin_alternation_t : public alternation_policy_t {
public:
    bool use_alternate(int instance_index) override;
};

/// Fair coin per instance from a seeded generator.
class random_alternation_t : public alternation_policy_t {
public:
    explicit random_alternation_t(unsigned int seed);
    bool use_alternate(int instance_index) override;

private:
    std::mt19937 rng_;
    std::bernoulli_distribution coin_;
};

enum class alternation_t { round_robin, random };
enum class failure_policy_t { abort, skip };

alternation_t parse_alternation(const std::string& id);        ///< "round-robin" | "random"
failure_policy_t parse_failure_policy(const std::string& id);  ///< "abort" | "skip"

std::unique_ptr<alternation_policy_t> make_alternation_policy(alternation_t kind, unsigned int seed);

/**
 * @brief Run configuration of a weighting experiment
 */
struct weighting_params_t {
    std::string scheme = "proximity-x";
    double dist_metric = 2.0;                    ///< Minkowski exponent z
    int k = 5;                                   ///< neighbors per instance
    weighting_space_t neighbor_space = weighting_space_t::input;
    alternation_t alternation = alternation_t::round_robin;
    unsigned int seed = 0;
    failure_policy_t on_failure = failure_policy_t::abort;
    bool verbose = false;
};

/**
 * @brief Rejects invalid settings before any computation
 * @throws std::invalid_argument for an unknown scheme, an invalid exponent or k < 1
 */
void validate_weighting_params(const weighting_params_t& params);

enum class weight_status_t {
    ok,
    rank_deficient,
    degenerate_hyperplane
};

const char* weight_status_name(weight_status_t status);

struct instance_weights_t {
    std::vector<double> weights;                 ///< NaN where status != ok
    std::vector<weighting_scheme_t> schemes;     ///< scheme used for each instance
    std::vector<weight_status_t> status;
    int n_failed = 0;

    int size() const { return static_cast<int>(weights.size()); }
};

/**
 * @brief Weighs every instance of a dataset
 *
 * The dataset is validated first. Instances are weighed independently and in
 * parallel when OpenMP is available. Numeric failures of the nonlinearity
 * scheme are either rethrown after the pass (failure_policy_t::abort, the
 * failure of the lowest instance index wins) or recorded with a NaN weight
 * (failure_policy_t::skip). Weights are returned as computed, unnormalized.
 *
 * @throws std::invalid_argument on an invalid dataset or exponent
 * @throws weighting_error subclasses under failure_policy_t::abort
 */
instance_weights_t weigh_instances(const dataset_t& data,
                                   const scheme_plan_t& plan,
                                   double dist_metric,
                                   const ols_solver_t& solver,
                                   alternation_policy_t& alternation,
                                   failure_policy_t on_failure,
                                   bool verbose = false);

/// Convenience overload resolving plan and alternation policy from params.
instance_weights_t weigh_instances(const dataset_t& data,
                                   const weighting_params_t& params,
                                   const ols_solver_t& solver);

} // namespace knnw

#endif // KNNW_INSTANCE_WEIGHTING_HPP_
