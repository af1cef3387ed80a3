#include "knnw/weighting_schemes.hpp"
#include "knnw/distance.hpp"
#include "knnw/hyperplane.hpp"

#include <vector>
#include <string>
#include <stdexcept>

#include <Eigen/Dense>

namespace knnw {

namespace {

// The input vector is a prefix of the input-output vector, so both spaces
// read from all_attrs() and differ only in the number of components
int space_dims(const instance_view_t& inst, weighting_space_t space) {
    return space == weighting_space_t::input ? inst.n_inputs() : inst.n_attrs();
}

}  // namespace

weighting_scheme_t parse_weighting_scheme(const std::string& id) {
    if (id == "proximity-x")    return weighting_scheme_t::proximity_x;
    if (id == "proximity-xy")   return weighting_scheme_t::proximity_xy;
    if (id == "surrounding-x")  return weighting_scheme_t::surrounding_x;
    if (id == "surrounding-xy") return weighting_scheme_t::surrounding_xy;
    if (id == "nonlinearity")   return weighting_scheme_t::nonlinearity;

    throw std::invalid_argument("invalid weighting scheme: '" + id + "'");
}

const char* weighting_scheme_name(weighting_scheme_t scheme) {
    switch (scheme) {
    case weighting_scheme_t::proximity_x:    return "proximity-x";
    case weighting_scheme_t::proximity_xy:   return "proximity-xy";
    case weighting_scheme_t::surrounding_x:  return "surrounding-x";
    case weighting_scheme_t::surrounding_xy: return "surrounding-xy";
    case weighting_scheme_t::nonlinearity:   return "nonlinearity";
    }
    throw std::invalid_argument("invalid weighting scheme value");
}

weighting_space_t weighting_scheme_space(weighting_scheme_t scheme) {
    switch (scheme) {
    case weighting_scheme_t::proximity_x:
    case weighting_scheme_t::surrounding_x:
        return weighting_space_t::input;
    case weighting_scheme_t::proximity_xy:
    case weighting_scheme_t::surrounding_xy:
    case weighting_scheme_t::nonlinearity:
        return weighting_space_t::input_output;
    }
    throw std::invalid_argument("invalid weighting scheme value");
}

weighting_space_t parse_weighting_space(const std::string& id) {
    if (id == "x")  return weighting_space_t::input;
    if (id == "xy") return weighting_space_t::input_output;
    throw std::invalid_argument("invalid vector space: '" + id + "' (expected x or xy)");
}

const char* weighting_space_name(weighting_space_t space) {
    return space == weighting_space_t::input ? "x" : "xy";
}

weighting_config_t make_weighting_config(const std::string& scheme_id, double dist_metric) {
    weighting_config_t config;
    config.scheme = parse_weighting_scheme(scheme_id);
    validate_dist_metric(dist_metric);
    config.dist_metric = dist_metric;
    return config;
}

double proximity(const instance_view_t& inst, weighting_space_t space, double dist_metric) {
    const double* p = inst.all_attrs();
    const int n_dims = space_dims(inst, space);

    double sum = 0.0;
    for (int j = 0; j < static_cast<int>(inst.neighbors().size()); ++j) {
        const double* q = inst.neighbor(j).all_attrs();
        sum += minkowski_distance(p, q, n_dims, dist_metric);
    }

    return sum;
}

double surrounding(const instance_view_t& inst, weighting_space_t space, double dist_metric) {
    const double* p = inst.all_attrs();
    const int n_dims = space_dims(inst, space);

    std::vector<double> resultant(n_dims, 0.0);
    for (int j = 0; j < static_cast<int>(inst.neighbors().size()); ++j) {
        const double* q = inst.neighbor(j).all_attrs();
        for (int i = 0; i < n_dims; ++i) {
            resultant[i] += p[i] - q[i];
        }
    }

    const std::vector<double> origin(n_dims, 0.0);
    return minkowski_distance(origin.data(), resultant.data(), n_dims, dist_metric);
}

double nonlinearity(const instance_view_t& inst, const ols_solver_t& solver) {
    const int n_inputs = inst.n_inputs();
    const int n_neighbors = static_cast<int>(inst.neighbors().size());
    const int n_rows = n_neighbors + 1;

    // Row 0 is the instance itself, rows 1..k its neighbors
    Eigen::MatrixXd X(n_rows, n_inputs);
    Eigen::VectorXd y(n_rows);

    X.row(0) = Eigen::Map<const Eigen::RowVectorXd>(inst.input(), n_inputs);
    y(0) = inst.output();

    for (int j = 0; j < n_neighbors; ++j) {
        const instance_view_t nn = inst.neighbor(j);
        X.row(j + 1) = Eigen::Map<const Eigen::RowVectorXd>(nn.input(), n_inputs);
        y(j + 1) = nn.output();
    }

    const ols_fit_t fit = solver.fit(y, X);
    if (fit.beta.size() != n_inputs + 1) {
        throw std::invalid_argument("regression solver returned " + std::to_string(fit.beta.size()) +
                                    " coefficients, expected " + std::to_string(n_inputs + 1));
    }

    const hyperplane_t plane = hyperplane_from_ols(fit.beta);
    return point_hyperplane_distance(inst.all_attrs(), plane);
}

double weigh_instance(const instance_view_t& inst,
                      const weighting_config_t& config,
                      const ols_solver_t& solver) {
    validate_dist_metric(config.dist_metric);

    switch (config.scheme) {
    case weighting_scheme_t::proximity_x:
    case weighting_scheme_t::proximity_xy:
        return proximity(inst, weighting_scheme_space(config.scheme), config.dist_metric);
    case weighting_scheme_t::surrounding_x:
    case weighting_scheme_t::surrounding_xy:
        return surrounding(inst, weighting_scheme_space(config.scheme), config.dist_metric);
    case weighting_scheme_t::nonlinearity:
        return nonlinearity(inst, solver);
    }
    throw std::invalid_argument("invalid weighting scheme value");
}

} // namespace knnw
