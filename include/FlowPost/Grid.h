#ifndef FLOWPOST_GRID_H
#define FLOWPOST_GRID_H

#include <vector>

#include <FlowPost/TypeDefs.h>
#include <FlowPost/Model.h>

namespace FLOW {

// Regular grid over a Bounds box: `grid_pts` points per axis, both ends included.
class Grid {
    public:
        // at most 10^9 nodes, so grid_pts^3 never overflows an index
        static constexpr size_t MAX_GRID_PTS = 1000;

        // @throws ConfigError unless 2 <= grid_pts <= MAX_GRID_PTS
        Grid(const Bounds & bounds, const size_t grid_pts);

        size_t grid_pts() const { return _grid_pts; }
        size_t size() const { return _grid_pts * _grid_pts * _grid_pts; }

        const Col & axis(const size_t dim) const { return _axes.at(dim); }
        const std::vector<Col> & axes() const { return _axes; }

        FlowVector point(const size_t i, const size_t j, const size_t k) const {
            return FlowVector(_axes[0][i], _axes[1][j], _axes[2][k]);
        }

    private:
        const size_t _grid_pts;
        std::vector<Col> _axes;
};

// An N-dimensional array of (unnormalized) density values on a grid.
//
// Values are stored row-major in a flat Col: the last remaining axis varies fastest.
// Each remaining axis remembers which original dimension it came from, so a field
// can be reduced one axis at a time without the caller tracking transpositions.
class DensityField {
    public:
        DensityField(const std::vector<size_t> & dims, const std::vector<Col> & coords);
        DensityField(const std::vector<size_t> & dims, const std::vector<Col> & coords, const Col & values);

        size_t ndims() const { return _dims.size(); }
        size_t size() const { return static_cast<size_t>(_values.size()); }
        const std::vector<size_t> & dims() const { return _dims; }
        const std::vector<Col> & coords() const { return _coords; }

        // position of original dimension `dim` among the remaining axes
        // @throws NumericError if `dim` has already been eliminated
        size_t position(const size_t dim) const;

        Col & values() { return _values; }
        const Col & values() const { return _values; }

        // trapezoidal integral along original dimension `dim`, yielding a field with one fewer axis
        DensityField integrate(const size_t dim) const;

        // integral over every remaining axis
        float_type integrate_all() const;

        // views of 1-D and 2-D fields; rows follow the first remaining axis
        Col as_col() const;
        Mat2D as_matrix() const;

        DensityField scaled(const float_type factor) const { return DensityField(_dims, _coords, _values * factor); }

    private:
        std::vector<size_t> _dims;
        std::vector<Col> _coords;
        Col _values;
};

// Everything produced by reducing a field in a given axis order:
// `partials[i]` is the field after eliminating order[0..i]; `total` is the
// integral over all axes eliminated.
struct Reduction {
    std::vector<DensityField> partials;
    float_type total;
};

// Nested trapezoidal quadrature; `order` must name every remaining dimension exactly once
// for `total` to be the full integral. Partial orders are allowed: then `total` is NaN
// and only `partials` are meaningful.
Reduction integrate(const DensityField & field, const std::vector<size_t> & order);

// 1-D composite trapezoid weights for (possibly non-uniform) abscissae
Col trapezoid_weights(const Col & x);

}

#endif // FLOWPOST_GRID_H
