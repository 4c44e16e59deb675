#include <FlowPost/Grid.h>
#include <FlowPost/Errors.h>

#include <algorithm>
#include <limits>
#include <sstream>

using std::vector;

namespace FLOW {

Grid::Grid(const Bounds & bounds, const size_t grid_pts) : _grid_pts(grid_pts) {
    if (grid_pts < 2) { throw ConfigError("grid_pts must be at least 2"); }
    if (grid_pts > MAX_GRID_PTS) {
        std::stringstream ss;
        ss << "grid_pts must be at most " << MAX_GRID_PTS << " (got " << grid_pts << ")";
        throw ConfigError(ss.str());
    }
    bounds.validate();
    for (size_t d = 0; d < NFLOW; ++d) {
        _axes.push_back(Col::LinSpaced(grid_pts, bounds.alpha[d], bounds.beta[d]));
    }
}

Col trapezoid_weights(const Col & x) {
    const Eigen::Index n = x.size();
    if (n < 2) { throw NumericError("trapezoidal rule needs at least 2 abscissae"); }
    Col w = Col::Zero(n);
    for (Eigen::Index k = 0; k < n - 1; ++k) {
        const float_type half = (x[k + 1] - x[k]) / 2.0;
        w[k] += half;
        w[k + 1] += half;
    }
    return w;
}

DensityField::DensityField(
    const vector<size_t> & dims,
    const vector<Col> & coords
) : _dims(dims), _coords(coords) {
    if (dims.size() != coords.size()) { throw NumericError("density field needs one coordinate axis per dimension"); }
    size_t n = 1;
    for (const Col & c : coords) { n *= static_cast<size_t>(c.size()); }
    _values = Col::Zero(n);
}

DensityField::DensityField(
    const vector<size_t> & dims,
    const vector<Col> & coords,
    const Col & values
) : DensityField(dims, coords) {
    if (values.size() != _values.size()) { throw NumericError("density values do not match the field shape"); }
    _values = values;
}

size_t DensityField::position(const size_t dim) const {
    auto it = std::find(_dims.begin(), _dims.end(), dim);
    if (it == _dims.end()) {
        std::stringstream ss;
        ss << "dimension " << dim << " is not present in this field";
        throw NumericError(ss.str());
    }
    return static_cast<size_t>(it - _dims.begin());
}

DensityField DensityField::integrate(const size_t dim) const {
    const size_t pos = position(dim);
    const Col w = trapezoid_weights(_coords[pos]);

    // view the flat storage as [outer][n][inner]
    const size_t n = static_cast<size_t>(_coords[pos].size());
    size_t outer = 1, inner = 1;
    for (size_t a = 0; a < pos; ++a) { outer *= static_cast<size_t>(_coords[a].size()); }
    for (size_t a = pos + 1; a < _coords.size(); ++a) { inner *= static_cast<size_t>(_coords[a].size()); }

    vector<size_t> rdims = _dims;
    vector<Col> rcoords = _coords;
    rdims.erase(rdims.begin() + pos);
    rcoords.erase(rcoords.begin() + pos);

    Col reduced = Col::Zero(outer * inner);
    for (size_t o = 0; o < outer; ++o) {
        for (size_t k = 0; k < n; ++k) {
            const float_type wk = w[k];
            const size_t src = (o * n + k) * inner;
            reduced.segment(o * inner, inner) += wk * _values.segment(src, inner);
        }
    }

    // eliminating the last axis leaves a 0-D field holding the integral
    return DensityField(rdims, rcoords, reduced);
}

float_type DensityField::integrate_all() const {
    if (_dims.empty()) { return _values[0]; }
    DensityField f = integrate(_dims.front());
    while (f.ndims() > 0) { f = f.integrate(f.dims().front()); }
    return f.values()[0];
}

Col DensityField::as_col() const {
    if (ndims() != 1) { throw NumericError("as_col() requires a 1-D field"); }
    return _values;
}

Mat2D DensityField::as_matrix() const {
    if (ndims() != 2) { throw NumericError("as_matrix() requires a 2-D field"); }
    const Eigen::Index rows = _coords[0].size(), cols = _coords[1].size();
    Mat2D m(rows, cols);
    for (Eigen::Index r = 0; r < rows; ++r) { m.row(r) = _values.segment(r * cols, cols).transpose(); }
    return m;
}

Reduction integrate(const DensityField & field, const vector<size_t> & order) {
    Reduction red;
    red.total = std::numeric_limits<float_type>::quiet_NaN();
    red.partials.reserve(order.size());
    const DensityField * current = &field;
    for (size_t dim : order) {
        red.partials.push_back(current->integrate(dim));
        current = &red.partials.back();
    }
    if (current->ndims() == 0) { red.total = current->values()[0]; }
    return red;
}

}
