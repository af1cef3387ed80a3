#include "knnw/instance_weighting.hpp"
#include "knnw/distance.hpp"
#include "knnw/exec_policy.hpp"
#include "knnw/progress_utils.hpp"
#include "knnw/weighting_errors.hpp"

#include <chrono>
#include <exception>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace knnw {

namespace {

struct weight_outcome_t {
    double weight = std::numeric_limits<double>::quiet_NaN();
    weight_status_t status = weight_status_t::ok;
    std::exception_ptr error;   ///< set for every failure
    bool fatal = false;         ///< failure that no policy may skip
};

}  // namespace

scheme_plan_t resolve_scheme_plan(const std::string& id) {
    scheme_plan_t plan;
    if (id == "remoteness-x") {
        plan.primary = weighting_scheme_t::proximity_x;
        plan.alternate = weighting_scheme_t::surrounding_x;
    } else if (id == "remoteness-xy") {
        plan.primary = weighting_scheme_t::proximity_xy;
        plan.alternate = weighting_scheme_t::surrounding_xy;
    } else {
        plan.primary = parse_weighting_scheme(id);
    }
    return plan;
}

bool round_robin_alternation_t::use_alternate(int instance_index) {
    return instance_index % 2 == 1;
}

random_alternation_t::random_alternation_t(unsigned int seed)
    : rng_(seed), coin_(0.5) {}

bool random_alternation_t::use_alternate(int) {
    return coin_(rng_);
}

alternation_t parse_alternation(const std::string& id) {
    if (id == "round-robin") return alternation_t::round_robin;
    if (id == "random")      return alternation_t::random;
    throw std::invalid_argument("invalid alternation policy: '" + id + "' (expected round-robin or random)");
}

failure_policy_t parse_failure_policy(const std::string& id) {
    if (id == "abort") return failure_policy_t::abort;
    if (id == "skip")  return failure_policy_t::skip;
    throw std::invalid_argument("invalid failure policy: '" + id + "' (expected abort or skip)");
}

std::unique_ptr<alternation_policy_t> make_alternation_policy(alternation_t kind, unsigned int seed) {
    switch (kind) {
    case alternation_t::round_robin:
        return std::make_unique<round_robin_alternation_t>();
    case alternation_t::random:
        return std::make_unique<random_alternation_t>(seed);
    }
    throw std::invalid_argument("invalid alternation policy value");
}

void validate_weighting_params(const weighting_params_t& params) {
    resolve_scheme_plan(params.scheme);
    validate_dist_metric(params.dist_metric);
    if (params.k < 1) {
        throw std::invalid_argument("number of neighbors k must be >= 1, got " + std::to_string(params.k));
    }
}

const char* weight_status_name(weight_status_t status) {
    switch (status) {
    case weight_status_t::ok:                    return "ok";
    case weight_status_t::rank_deficient:        return "rank-deficient";
    case weight_status_t::degenerate_hyperplane: return "degenerate-hyperplane";
    }
    return "unknown";
}

instance_weights_t weigh_instances(const dataset_t& data,
                                   const scheme_plan_t& plan,
                                   double dist_metric,
                                   const ols_solver_t& solver,
                                   alternation_policy_t& alternation,
                                   failure_policy_t on_failure,
                                   bool verbose) {
    validate_dataset(data);
    validate_dist_metric(dist_metric);

    auto ptm = std::chrono::steady_clock::now();
    const int n_instances = data.size();

    if (verbose) {
        progress_log("Weighing %d instances with %s%s%s (z = %g)",
                     n_instances,
                     weighting_scheme_name(plan.primary),
                     plan.is_composite() ? " / " : "",
                     plan.is_composite() ? weighting_scheme_name(*plan.alternate) : "",
                     dist_metric);
    }

    // Scheme assignment is sequential so that stateful policies stay reproducible
    instance_weights_t result;
    result.schemes.resize(n_instances, plan.primary);
    if (plan.is_composite()) {
        for (int i = 0; i < n_instances; ++i) {
            if (alternation.use_alternate(i)) result.schemes[i] = *plan.alternate;
        }
    }

    std::vector<int> indices(n_instances);
    std::iota(indices.begin(), indices.end(), 0);
    std::vector<weight_outcome_t> outcomes(n_instances);

    knnw::transform(KNNW_EXEC_POLICY, indices.begin(), indices.end(), outcomes.begin(),
        [&](int i) {
            weight_outcome_t out;
            const weighting_config_t config{result.schemes[i], dist_metric};
            try {
                out.weight = weigh_instance(data.instance(i), config, solver);
            } catch (const rank_deficient_error&) {
                out.status = weight_status_t::rank_deficient;
                out.error = std::current_exception();
            } catch (const degenerate_hyperplane_error&) {
                out.status = weight_status_t::degenerate_hyperplane;
                out.error = std::current_exception();
            } catch (...) {
                // Exceptions must not cross the OpenMP region; rethrown below
                out.error = std::current_exception();
                out.fatal = true;
            }
            return out;
        });

    result.weights.resize(n_instances);
    result.status.resize(n_instances);
    for (int i = 0; i < n_instances; ++i) {
        const weight_outcome_t& out = outcomes[i];
        if (out.error && (out.fatal || on_failure == failure_policy_t::abort)) {
            if (verbose) progress_log("Instance %d failed; aborting", i);
            std::rethrow_exception(out.error);
        }
        result.weights[i] = out.weight;
        result.status[i] = out.status;
        if (out.status != weight_status_t::ok) {
            result.weights[i] = std::numeric_limits<double>::quiet_NaN();
            ++result.n_failed;
        }
    }

    if (verbose) {
        if (result.n_failed > 0) {
            progress_log("Skipped %d of %d instances", result.n_failed, n_instances);
        }
        elapsed_time(ptm, "Weighting done", true, true);
    }

    return result;
}

instance_weights_t weigh_instances(const dataset_t& data,
                                   const weighting_params_t& params,
                                   const ols_solver_t& solver) {
    validate_weighting_params(params);

    const scheme_plan_t plan = resolve_scheme_plan(params.scheme);
    auto alternation = make_alternation_policy(params.alternation, params.seed);

    return weigh_instances(data, plan, params.dist_metric, solver, *alternation,
                           params.on_failure, params.verbose);
}

} // namespace knnw
