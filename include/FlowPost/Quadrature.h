#ifndef FLOWPOST_QUADRATURE_H
#define FLOWPOST_QUADRATURE_H

#include <FlowPost/TypeDefs.h>
#include <FlowPost/Model.h>
#include <FlowPost/Grid.h>

namespace FLOW {

// GridQuadrature evaluates the posterior on a regular grid over the prior box, then
// integrates with nested trapezoidal rules to get the evidence and marginals.
//
// The stored field is exp(log p - max log p): the scale is kept separately in log space,
// so neither the LOG_ZERO sentinel nor a very peaked posterior can overflow or produce NaN.
// The posterior is copied in; it is small and immutable.
class GridQuadrature {
    public:
        static constexpr size_t DEFAULT_GRID_PTS = 100;

        GridQuadrature(const LogPosterior & posterior, const size_t grid_pts = DEFAULT_GRID_PTS);

        // evaluate the density on every grid point and integrate it
        // @throws NumericError if the field carries no mass
        void run();

        bool done() const { return _done; }

        const Grid & grid() const { return _grid; }
        const LogPosterior & posterior() const { return _posterior; }

        // scaled, unnormalized density; actual density = field * exp(log_scale())
        const DensityField & field() const { return _field; }
        float_type log_scale() const { return _log_scale; }

        float_type log_evidence() const;
        // may underflow to 0 for very peaked posteriors; prefer log_evidence()
        float_type evidence() const;

        // field divided by Z; integrates to 1 over the box
        DensityField normalized() const;

        // normalized 1-D marginal over `dim`, one value per grid coordinate on that axis
        Col marginal(const size_t dim) const;

        // normalized 2-D marginal; rows index `dim_a`, columns index `dim_b`
        Mat2D marginal(const size_t dim_a, const size_t dim_b) const;

        // posterior mean of each flow
        FlowVector mean() const;

    private:
        const LogPosterior _posterior;
        const Grid _grid;
        DensityField _field;
        float_type _log_scale;
        float_type _scaled_z;   // integral of the scaled field
        bool _done;

        void _require_done() const;
};

}

#endif // FLOWPOST_QUADRATURE_H
