#include <FlowPost/Analytical.h>
#include <FlowPost/Grid.h>
#include <FlowPost/Errors.h>

#include <cmath>

namespace FLOW {

float_type analytical_log_marginal(
    const float_type x2, const float_type x3,
    const float_type y, const float_type sigma, const float_type sigma_e
) {
    const float_type var = sigma * sigma;
    const float_type var_e = sigma_e * sigma_e;
    const float_type s = x2 + x3;
    // coefficient of x1^2 in the exponent once both Gaussians are multiplied together
    const float_type a = 1.0 / (2.0 * var) + 1.0 / (2.0 * var_e);
    const float_type b = y / var + s / var_e;

    return -0.5 * std::log(2.0 * M_PI * var)
           -0.5 * std::log(2.0 * M_PI * var_e)
           - s * s / (2.0 * var_e)
           - y * y / (2.0 * var)
           + 0.5 * std::log(M_PI / a)
           + b * b / (4.0 * a);
}

Mat2D analytical_log_marginal(const Col & x2s, const Col & x3s, const ModelParameters & params) {
    Mat2D logc(x2s.size(), x3s.size());
    for (Eigen::Index r = 0; r < x2s.size(); ++r) {
        for (Eigen::Index c = 0; c < x3s.size(); ++c) {
            logc(r, c) = analytical_log_marginal(x2s[r], x3s[c], params);
        }
    }
    return logc;
}

Mat2D normalized_analytical_marginal(const Col & x2s, const Col & x3s, const ModelParameters & params) {
    const Mat2D logc = analytical_log_marginal(x2s, x3s, params);
    const Mat2D dens = (logc.array() - logc.maxCoeff()).exp().matrix();
    const float_type z = trapezoid_weights(x2s).dot(dens * trapezoid_weights(x3s));
    if (not (std::isfinite(z) and z > 0)) { throw NumericError("closed-form marginal has no mass on the requested grid"); }
    return dens / z;
}

}
