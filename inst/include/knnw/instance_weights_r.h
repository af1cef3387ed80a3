#ifndef KNNW_INSTANCE_WEIGHTS_R_H_
#define KNNW_INSTANCE_WEIGHTS_R_H_

#include <Rinternals.h>

#ifdef __cplusplus
extern "C" {
#endif

	SEXP S_instance_weights(
		SEXP s_X,
		SEXP s_y,
		SEXP s_nn_i,
		SEXP s_scheme,
		SEXP s_dist_metric,
		SEXP s_alternation,
		SEXP s_seed,
		SEXP s_on_failure,
		SEXP s_verbose
		);

#ifdef __cplusplus
}
#endif
#endif // KNNW_INSTANCE_WEIGHTS_R_H_
