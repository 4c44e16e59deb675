#include "testing.h"
#include <FlowPost/Quadrature.h>
#include <FlowPost/FlowUtil.h>
#include <FlowPost/Errors.h>

#include <cmath>

using namespace FLOW;

ModelParameters params(const float_type sigma, const float_type sigma_e) {
    ModelParameters p;
    p.y = 1.5;
    p.sigma = sigma;
    p.sigma_e = sigma_e;
    return p;
}

const Bounds BOX{ FlowVector::Constant(0.0), FlowVector::Constant(3.0) };

void series_normalization() {
    const LogPosterior lp(params(0.2, 0.2), BOX);
    GridQuadrature quad(lp, 41);
    quad.run();
    IS_TRUE(quad.done());

    // Z normalizes the field to unit mass
    IS_TRUE(std::abs(quad.normalized().integrate_all() - 1.0) < 1e-9);
    IS_TRUE(std::isfinite(quad.log_evidence()));
    IS_TRUE(std::abs(quad.evidence() - std::exp(quad.log_evidence())) < 1e-12 * quad.evidence());

    // every 1-D marginal is a density on its axis
    for (size_t d = 0; d < NFLOW; ++d) {
        const Col p = quad.marginal(d);
        IS_TRUE(p.size() == 41);
        IS_TRUE(p.minCoeff() >= 0.0);
        IS_TRUE(std::abs(trapezoid(p, quad.grid().axis(d)) - 1.0) < 1e-9);
    }

    // ... and the 2-D marginals agree with them
    const Mat2D p12 = quad.marginal(0, 1);
    const Col from_2d = p12 * trapezoid_weights(quad.grid().axis(1));
    IS_TRUE((from_2d - quad.marginal(0)).cwiseAbs().maxCoeff() < 1e-9);
    IS_TRUE((quad.marginal(1, 0) - p12.transpose()).cwiseAbs().maxCoeff() < 1e-15);
    IS_TRUE(std::abs(trapezoid(quad.marginal(1, 2), quad.grid().axis(1), quad.grid().axis(2)) - 1.0) < 1e-9);
}

void series_posterior_shape() {
    const LogPosterior lp(params(0.2, 0.2), BOX);
    GridQuadrature quad(lp, 61);
    quad.run();
    const FlowVector mu = quad.mean();
    // x1 is pulled toward the measurement; x2 and x3 share the rest symmetrically
    IS_TRUE(std::abs(mu[0] - 1.5) < 0.1);
    IS_TRUE(std::abs(mu[1] - mu[2]) < 1e-9);
    IS_TRUE(std::abs(mu[1] + mu[2] - mu[0]) < 0.1);

    Eigen::Index imax;
    quad.marginal(0).maxCoeff(&imax);
    IS_TRUE(std::abs(quad.grid().axis(0)[imax] - 1.5) < 0.1);
}

void series_peaked_constraint() {
    // the default configuration: the balance is nearly a hard constraint
    const LogPosterior lp(params(0.1, 1e-4), BOX);
    GridQuadrature quad(lp);
    IS_TRUE(quad.grid().grid_pts() == GridQuadrature::DEFAULT_GRID_PTS);
    quad.run();
    IS_TRUE(std::isfinite(quad.log_evidence()));
    IS_TRUE(quad.field().values().allFinite());
    for (size_t d = 0; d < NFLOW; ++d) {
        const Col p = quad.marginal(d);
        IS_TRUE(p.allFinite());
        IS_TRUE(std::abs(trapezoid(p, quad.grid().axis(d)) - 1.0) < 1e-9);
    }
}

void series_errors() {
    const LogPosterior lp(params(0.2, 0.2), BOX);
    GridQuadrature quad(lp, 11);
    THROWS(quad.marginal(0), NumericError);
    THROWS(quad.log_evidence(), NumericError);
    quad.run();
    THROWS(quad.marginal(3), NumericError);
    THROWS(quad.marginal(1, 1), NumericError);
    THROWS(GridQuadrature(lp, 1), ConfigError);
    THROWS(GridQuadrature(lp, Grid::MAX_GRID_PTS + 1), ConfigError);
}

void series_owns_posterior() {
    // built from a temporary posterior; the quadrature keeps its own copy
    GridQuadrature quad(LogPosterior(params(0.2, 0.2), BOX), 11);
    quad.run();
    IS_TRUE(quad.done());
    IS_TRUE(quad.posterior().parameters().sigma == 0.2);
    IS_TRUE(quad.posterior().bounds().beta == BOX.beta);

    const LogPosterior same(params(0.2, 0.2), BOX);
    GridQuadrature reference(same, 11);
    reference.run();
    IS_TRUE(quad.log_evidence() == reference.log_evidence());
}

int main(void) {
    series_normalization();
    series_posterior_shape();
    series_peaked_constraint();
    series_errors();
    series_owns_posterior();
    return test_failures;
}
