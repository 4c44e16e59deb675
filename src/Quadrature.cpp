#include <FlowPost/Quadrature.h>
#include <FlowPost/Errors.h>

#include <cmath>
#include <sstream>
#include <vector>

using std::vector;

namespace FLOW {

GridQuadrature::GridQuadrature(
    const LogPosterior & posterior,
    const size_t grid_pts
) : _posterior(posterior), _grid(posterior.bounds(), grid_pts),
    _field({0, 1, 2}, _grid.axes()), _log_scale(0.0), _scaled_z(0.0), _done(false) {}

void GridQuadrature::run() {
    const size_t n = _grid.grid_pts();
    Col & vals = _field.values();

    // log densities first; all of them are needed before the scale is known
    float_type max_logp = LOG_ZERO;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            for (size_t k = 0; k < n; ++k) {
                const size_t idx = (i * n + j) * n + k;
                vals[idx] = _posterior(_grid.point(i, j, k));
                if (vals[idx] > max_logp) { max_logp = vals[idx]; }
            }
        }
    }

    if (max_logp == LOG_ZERO) {
        throw NumericError("posterior is zero on every grid point; is the box degenerate?");
    }

    for (Eigen::Index idx = 0; idx < vals.size(); ++idx) {
        vals[idx] = (vals[idx] == LOG_ZERO) ? 0.0 : std::exp(vals[idx] - max_logp);
    }

    _log_scale = max_logp;
    _scaled_z = integrate(_field, {0, 1, 2}).total;

    if (not (std::isfinite(_scaled_z) and _scaled_z > 0)) {
        std::stringstream ss;
        ss << "normalizing constant is not positive and finite (scaled Z = " << _scaled_z << ")";
        throw NumericError(ss.str());
    }
    _done = true;
}

void GridQuadrature::_require_done() const {
    if (not _done) { throw NumericError("quadrature results requested before run()"); }
}

float_type GridQuadrature::log_evidence() const {
    _require_done();
    return _log_scale + std::log(_scaled_z);
}

float_type GridQuadrature::evidence() const {
    return std::exp(log_evidence());
}

DensityField GridQuadrature::normalized() const {
    _require_done();
    return _field.scaled(1.0 / _scaled_z);
}

Col GridQuadrature::marginal(const size_t dim) const {
    _require_done();
    vector<size_t> order;
    for (size_t d = 0; d < NFLOW; ++d) { if (d != dim) { order.push_back(d); } }
    if (order.size() != NFLOW - 1) { throw NumericError("marginal requested for an unknown dimension"); }
    Reduction red = integrate(_field, order);
    return red.partials.back().as_col() / _scaled_z;
}

Mat2D GridQuadrature::marginal(const size_t dim_a, const size_t dim_b) const {
    _require_done();
    if (dim_a == dim_b or dim_a >= NFLOW or dim_b >= NFLOW) {
        throw NumericError("2-D marginal needs two distinct flow dimensions");
    }
    const size_t other = 3 - dim_a - dim_b; // {0, 1, 2} sums to 3
    Mat2D m = _field.integrate(other).as_matrix() / _scaled_z;
    // remaining axes keep their original order; transpose if the caller asked for (b, a)
    return (dim_a < dim_b) ? m : Mat2D(m.transpose());
}

FlowVector GridQuadrature::mean() const {
    FlowVector mu;
    for (size_t d = 0; d < NFLOW; ++d) {
        const Col & x = _grid.axis(d);
        const Col p = marginal(d);
        mu[d] = trapezoid_weights(x).dot(p.cwiseProduct(x));
    }
    return mu;
}

}
