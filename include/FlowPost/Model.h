#ifndef FLOWPOST_MODEL_H
#define FLOWPOST_MODEL_H

#include <FlowPost/TypeDefs.h>

// The model is a single splitter: stream 1 is measured, streams 2 and 3 are not,
// and the balance x1 = x2 + x3 holds up to a small Gaussian error.
//
// Design goals for the model types:
//  - immutable once a run starts; validated once, at construction of the LogPosterior
//  - no knowledge of how they are consumed (quadrature, sampling, closed form)
//  - the incidence vector is configurable, even though the splitter always uses [1, -1, -1]

namespace FLOW {

    // Axis-aligned box of the uniform prior; alpha is the lower corner, beta the upper
    struct Bounds {
        FlowVector alpha;
        FlowVector beta;

        // strictly inside; a point on a face is outside
        bool contains(const FlowVector & x) const {
            return ((alpha.array() < x.array()) and (x.array() < beta.array())).all();
        }

        FlowVector width() const { return beta - alpha; }
        FlowVector midpoint() const { return alpha + width() / 2.0; }

        // @throws ConfigError unless alpha[i] < beta[i] for every i
        void validate() const;
    };

    struct ModelParameters {
        float_type y;        // measured value of x1
        float_type sigma;    // measurement standard deviation
        float_type sigma_e;  // balance-error standard deviation; << sigma for a near-hard constraint
        FlowVector M = FlowVector(1.0, -1.0, -1.0); // incidence (balance) coefficients

        float_type var() const { return sigma * sigma; }
        float_type var_e() const { return sigma_e * sigma_e; }

        // signed balance residual, M.x
        float_type residual(const FlowVector & x) const { return M.dot(x); }

        // @throws ConfigError unless both standard deviations are positive and finite
        void validate() const;
    };

    // Unnormalized log density of the flow posterior:
    //   log p(x | y) = -(y - x1)^2 / (2 sigma^2) - (M.x)^2 / (2 sigma_e^2) + const,  x inside the box
    //                = LOG_ZERO,                                                       otherwise
    class LogPosterior {
        public:
            LogPosterior(const ModelParameters & params, const Bounds & bounds);

            float_type evaluate(const FlowVector & x) const;
            float_type operator()(const FlowVector & x) const { return evaluate(x); }

            const ModelParameters & parameters() const { return _params; }
            const Bounds & bounds() const { return _bounds; }

        private:
            const ModelParameters _params;
            const Bounds _bounds;
            // cached 1/(2 var) terms; evaluate() is the sampler's hot path
            const float_type _half_prec;
            const float_type _half_prec_e;
    };

}

#endif // FLOWPOST_MODEL_H
