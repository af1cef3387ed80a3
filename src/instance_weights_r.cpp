#include "knnw/instance_weights_r.h"
#include "knnw/instance_weighting.hpp"
#include "knnw/ols.hpp"
#include "knnw/progress_utils.hpp"

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include <R.h>
#include <Rinternals.h>
#include <R_ext/Print.h>
#include <R_ext/Rdynload.h>

namespace {

void r_progress_sink(const char* text) {
    Rprintf("%s", text);
    R_FlushConsole();
}

/**
 * @brief Builds a dataset from an R numeric matrix, response vector and
 *        integer matrix of 1-based neighbor indices
 *
 * R matrices are column-major, so element (i, j) lives at i + j * nrow.
 */
knnw::dataset_t dataset_from_R(SEXP s_X, SEXP s_y, SEXP s_nn_i) {
    if (!Rf_isMatrix(s_X) || !Rf_isReal(s_X)) {
        throw std::invalid_argument("X must be a numeric matrix");
    }
    if (!Rf_isReal(s_y)) {
        throw std::invalid_argument("y must be a numeric vector");
    }
    if (!Rf_isMatrix(s_nn_i) || !Rf_isInteger(s_nn_i)) {
        throw std::invalid_argument("nn.i must be an integer matrix");
    }

    const int n_rows = Rf_nrows(s_X);
    const int n_inputs = Rf_ncols(s_X);
    if (LENGTH(s_y) != n_rows) {
        throw std::invalid_argument("length(y) = " + std::to_string(LENGTH(s_y)) +
                                    " differs from nrow(X) = " + std::to_string(n_rows));
    }
    if (Rf_nrows(s_nn_i) != n_rows) {
        throw std::invalid_argument("nn.i must have one row per row of X");
    }

    const double* X = REAL(s_X);
    const double* y = REAL(s_y);
    const int* nn_i = INTEGER(s_nn_i);
    const int k = Rf_ncols(s_nn_i);

    knnw::dataset_t data(n_inputs);
    std::vector<double> input(n_inputs);
    for (int i = 0; i < n_rows; ++i) {
        for (int j = 0; j < n_inputs; ++j) {
            input[j] = X[i + j * n_rows];
        }
        data.add_instance(input, y[i]);

        std::vector<int> nn(k);
        for (int j = 0; j < k; ++j) {
            const int idx = nn_i[i + j * n_rows];
            if (idx == NA_INTEGER) {
                throw std::invalid_argument("nn.i contains NA at row " + std::to_string(i + 1));
            }
            nn[j] = idx - 1;  // 0-based
        }
        data.set_neighbors(i, std::move(nn));
    }

    return data;
}

std::string string_arg(SEXP s, const char* name) {
    if (!Rf_isString(s) || LENGTH(s) != 1 || STRING_ELT(s, 0) == NA_STRING) {
        throw std::invalid_argument(std::string(name) + " must be a single string");
    }
    return CHAR(STRING_ELT(s, 0));
}

constexpr int n_scheme_labels = 5;
constexpr int n_status_labels = 3;

/**
 * @brief Allocates the result list for n instances: weights, schemes,
 *        status and n_failed
 *
 * Called before any C++ object with a destructor exists, so an R allocation
 * error cannot skip a destructor.
 */
SEXP alloc_result(int n) {
    SEXP r_result = PROTECT(Rf_allocVector(VECSXP, 4));

    // names for list elements
    {
        SEXP names = PROTECT(Rf_allocVector(STRSXP, 4));
        SET_STRING_ELT(names, 0, Rf_mkChar("weights"));
        SET_STRING_ELT(names, 1, Rf_mkChar("schemes"));
        SET_STRING_ELT(names, 2, Rf_mkChar("status"));
        SET_STRING_ELT(names, 3, Rf_mkChar("n_failed"));
        Rf_setAttrib(r_result, R_NamesSymbol, names);
        UNPROTECT(1); // names
    }

    SET_VECTOR_ELT(r_result, 0, Rf_allocVector(REALSXP, n));
    SET_VECTOR_ELT(r_result, 1, Rf_allocVector(STRSXP, n));
    SET_VECTOR_ELT(r_result, 2, Rf_allocVector(STRSXP, n));
    SET_VECTOR_ELT(r_result, 3, Rf_ScalarInteger(0));

    UNPROTECT(1); // r_result
    return r_result;
}

/// Scheme names in enum order, followed by the status names in enum order.
SEXP alloc_labels() {
    static const knnw::weighting_scheme_t schemes[n_scheme_labels] = {
        knnw::weighting_scheme_t::proximity_x,
        knnw::weighting_scheme_t::proximity_xy,
        knnw::weighting_scheme_t::surrounding_x,
        knnw::weighting_scheme_t::surrounding_xy,
        knnw::weighting_scheme_t::nonlinearity
    };
    static const knnw::weight_status_t statuses[n_status_labels] = {
        knnw::weight_status_t::ok,
        knnw::weight_status_t::rank_deficient,
        knnw::weight_status_t::degenerate_hyperplane
    };

    SEXP labels = PROTECT(Rf_allocVector(STRSXP, n_scheme_labels + n_status_labels));
    for (int i = 0; i < n_scheme_labels; ++i) {
        SET_STRING_ELT(labels, i, Rf_mkChar(knnw::weighting_scheme_name(schemes[i])));
    }
    for (int i = 0; i < n_status_labels; ++i) {
        SET_STRING_ELT(labels, n_scheme_labels + i, Rf_mkChar(knnw::weight_status_name(statuses[i])));
    }
    UNPROTECT(1); // labels
    return labels;
}

/// Copies result into a list from alloc_result(); allocates nothing in R.
void fill_result(const knnw::instance_weights_t& result, SEXP r_result, SEXP labels) {
    double* weights = REAL(VECTOR_ELT(r_result, 0));
    SEXP schemes_r = VECTOR_ELT(r_result, 1);
    SEXP status_r = VECTOR_ELT(r_result, 2);

    for (int i = 0; i < result.size(); ++i) {
        weights[i] = result.status[i] == knnw::weight_status_t::ok ? result.weights[i] : NA_REAL;
        SET_STRING_ELT(schemes_r, i, STRING_ELT(labels, static_cast<int>(result.schemes[i])));
        SET_STRING_ELT(status_r, i, STRING_ELT(labels, n_scheme_labels + static_cast<int>(result.status[i])));
    }
    INTEGER(VECTOR_ELT(r_result, 3))[0] = result.n_failed;
}

}  // namespace

/**
 * @brief R interface to weigh_instances()
 *
 * @param s_X Numeric matrix of inputs (n x D)
 * @param s_y Numeric vector of outputs (n)
 * @param s_nn_i Integer matrix (n x k) of 1-based neighbor indices
 * @param s_scheme Scheme identifier, including the remoteness composites
 * @param s_dist_metric Minkowski exponent
 * @param s_alternation "round-robin" or "random"
 * @param s_seed Seed of the random alternation
 * @param s_on_failure "abort" or "skip"
 * @param s_verbose Logical
 *
 * @return Named list: weights (NA where skipped), schemes, status, n_failed
 */
SEXP S_instance_weights(
    SEXP s_X,
    SEXP s_y,
    SEXP s_nn_i,
    SEXP s_scheme,
    SEXP s_dist_metric,
    SEXP s_alternation,
    SEXP s_seed,
    SEXP s_on_failure,
    SEXP s_verbose) {

    // Rf_error longjmps, so it is only called once every C++ object is gone
    char error_msg[2048] = {0};

    const int n_rows = Rf_isMatrix(s_X) ? Rf_nrows(s_X) : 0;
    SEXP r_result = PROTECT(alloc_result(n_rows));
    SEXP labels = PROTECT(alloc_labels());

    try {
        knnw::dataset_t data = dataset_from_R(s_X, s_y, s_nn_i);

        // Neighbors come precomputed from R, so no k is involved here
        const knnw::scheme_plan_t plan = knnw::resolve_scheme_plan(string_arg(s_scheme, "scheme"));
        const double dist_metric = Rf_asReal(s_dist_metric);
        const knnw::alternation_t alternation =
            knnw::parse_alternation(string_arg(s_alternation, "alternation"));
        const unsigned int seed = static_cast<unsigned int>(Rf_asInteger(s_seed));
        const knnw::failure_policy_t on_failure =
            knnw::parse_failure_policy(string_arg(s_on_failure, "on.failure"));
        const bool verbose = (Rf_asLogical(s_verbose) == TRUE);

        auto policy = knnw::make_alternation_policy(alternation, seed);
        const knnw::eigen_ols_solver_t solver;
        const knnw::instance_weights_t result =
            knnw::weigh_instances(data, plan, dist_metric, solver, *policy, on_failure, verbose);

        fill_result(result, r_result, labels);
    }
    catch (const std::exception& e) {
        std::snprintf(error_msg, sizeof(error_msg), "instance_weights: %s", e.what());
    }

    UNPROTECT(2); // labels, r_result
    if (error_msg[0] != '\0') {
        Rf_error("%s", error_msg);
    }
    return r_result;
}

extern "C" {

static const R_CallMethodDef call_methods[] = {
    {"S_instance_weights", (DL_FUNC) &S_instance_weights, 9},
    {NULL, NULL, 0}
};

void R_init_knnw(DllInfo* dll) {
    R_registerRoutines(dll, NULL, call_methods, NULL, NULL);
    R_useDynamicSymbols(dll, FALSE);
    knnw::set_progress_sink(&r_progress_sink);
}

}
