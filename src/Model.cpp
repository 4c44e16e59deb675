#include <FlowPost/Model.h>
#include <FlowPost/Errors.h>

#include <cmath>
#include <sstream>

namespace FLOW {

void Bounds::validate() const {
    for (size_t i = 0; i < NFLOW; ++i) {
        if (not (std::isfinite(alpha[i]) and std::isfinite(beta[i]))) {
            std::stringstream ss;
            ss << "bounds for x" << (i + 1) << " must be finite";
            throw ConfigError(ss.str());
        }
        if (not (alpha[i] < beta[i])) {
            std::stringstream ss;
            ss << "lower bound (" << alpha[i] << ") must be less than upper bound (" << beta[i] << ") for x" << (i + 1);
            throw ConfigError(ss.str());
        }
    }
}

void ModelParameters::validate() const {
    if (not (std::isfinite(sigma) and sigma > 0)) { throw ConfigError("sigma must be positive"); }
    if (not (std::isfinite(sigma_e) and sigma_e > 0)) { throw ConfigError("sigma_e must be positive"); }
    if (not std::isfinite(y)) { throw ConfigError("measurement must be finite"); }
    if (not M.allFinite()) { throw ConfigError("incidence coefficients must be finite"); }
}

LogPosterior::LogPosterior(
    const ModelParameters & params,
    const Bounds & bounds
) : _params(params), _bounds(bounds),
    _half_prec(0.5 / params.var()), _half_prec_e(0.5 / params.var_e()) {
    _params.validate();
    _bounds.validate();
}

float_type LogPosterior::evaluate(const FlowVector & x) const {
    if (not _bounds.contains(x)) { return LOG_ZERO; }
    const float_type dy = _params.y - x[0];
    const float_type r = _params.residual(x);
    return -dy * dy * _half_prec - r * r * _half_prec_e;
}

}
