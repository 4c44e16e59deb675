#ifndef FLOWPOST_ANALYTICAL_H
#define FLOWPOST_ANALYTICAL_H

#include <FlowPost/TypeDefs.h>
#include <FlowPost/Model.h>

namespace FLOW {

// Closed-form log density of the (x2, x3) marginal, with x1 integrated out of
//   N(y; x1, sigma^2) * N(x1; x2 + x3, sigma_e^2)
// over the whole real line.
//
// The prior box truncates x1 to [alpha1, beta1], which this formula ignores, so it is only
// exact when that interval holds essentially all of the x1 Gaussian (width ~ sigma * sigma_e /
// sqrt(sigma^2 + sigma_e^2), centred between y and x2 + x3). For tight bounds it is an
// approximation. It also assumes the incidence vector is [1, -1, -1].
float_type analytical_log_marginal(
    const float_type x2, const float_type x3,
    const float_type y, const float_type sigma, const float_type sigma_e
);

inline float_type analytical_log_marginal(const float_type x2, const float_type x3, const ModelParameters & params) {
    return analytical_log_marginal(x2, x3, params.y, params.sigma, params.sigma_e);
}

// log density on every (x2s[r], x3s[c]) pair
Mat2D analytical_log_marginal(const Col & x2s, const Col & x3s, const ModelParameters & params);

// the same, exponentiated (max factored out) and normalized to integrate to 1 over the given grid
Mat2D normalized_analytical_marginal(const Col & x2s, const Col & x3s, const ModelParameters & params);

}

#endif // FLOWPOST_ANALYTICAL_H
