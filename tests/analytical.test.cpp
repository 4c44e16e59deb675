#include "testing.h"
#include <FlowPost/Analytical.h>
#include <FlowPost/Quadrature.h>
#include <FlowPost/FlowUtil.h>
#include <FlowPost/Grid.h>
#include <FlowPost/Errors.h>

#include <cmath>
#include <utility>
#include <vector>

using namespace FLOW;

ModelParameters params(const float_type sigma, const float_type sigma_e) {
    ModelParameters p;
    p.y = 1.5;
    p.sigma = sigma;
    p.sigma_e = sigma_e;
    return p;
}

const Bounds BOX{ FlowVector::Constant(0.0), FlowVector::Constant(3.0) };

float_type log_normal(const float_type x, const float_type mu, const float_type var) {
    return -0.5 * std::log(2.0 * M_PI * var) - (x - mu) * (x - mu) / (2.0 * var);
}

void series_ridge() {
    const ModelParameters p = params(0.1, 1e-4);
    const float_type on_ridge = analytical_log_marginal(0.75, 0.75, p);
    const float_type at_origin = analytical_log_marginal(0.0, 0.0, p);
    std::cout << "log density gap, ridge vs origin: " << on_ridge - at_origin << std::endl;
    IS_TRUE(on_ridge - at_origin > std::log(1e6));
    IS_TRUE(std::abs((on_ridge - at_origin) - 1.5 * 1.5 / (2.0 * (0.01 + 1e-8))) < 1e-4);

    // only x2 + x3 matters
    IS_TRUE(std::abs(analytical_log_marginal(0.2, 1.3, p) - analytical_log_marginal(1.3, 0.2, p)) < 1e-9);
    IS_TRUE(std::abs(analytical_log_marginal(0.5, 1.0, p) - on_ridge) < 1e-9);
}

void series_gaussian_identity() {
    // integrating x1 out of two Gaussians leaves N(y; x2 + x3, sigma^2 + sigma_e^2)
    const ModelParameters p = params(0.3, 0.4);
    for (const float_type s : { 0.0, 0.7, 1.5, 2.9 }) {
        const float_type expected = log_normal(p.y, s, p.var() + p.var_e());
        IS_TRUE(std::abs(analytical_log_marginal(s / 2.0, s / 2.0, p) - expected) < 1e-9);
    }
}

void series_direct_integral() {
    // brute-force the x1 integral with a fine trapezoid over a range far wider than both Gaussians
    const ModelParameters p = params(0.1, 0.05);
    const Col x1 = Col::LinSpaced(40001, -4.0, 6.0);
    const std::vector<std::pair<float_type, float_type>> points = { { 0.75, 0.75 }, { 0.4, 0.9 }, { 1.0, 1.1 } };
    for (const auto & pt : points) {
        const float_type s = pt.first + pt.second;
        Col integrand(x1.size());
        for (Eigen::Index i = 0; i < x1.size(); ++i) {
            integrand[i] = std::exp(log_normal(p.y, x1[i], p.var()) + log_normal(x1[i], s, p.var_e()));
        }
        const float_type numeric = trapezoid(integrand, x1);
        const float_type closed = std::exp(analytical_log_marginal(pt.first, pt.second, p));
        IS_TRUE(std::abs(numeric - closed) < 1e-6 * closed);
    }
}

void series_grid_forms() {
    const ModelParameters p = params(0.2, 0.2);
    const Col x2s = Col::LinSpaced(21, 0.0, 3.0);
    const Col x3s = Col::LinSpaced(11, 0.0, 3.0);
    const Mat2D logc = analytical_log_marginal(x2s, x3s, p);
    IS_TRUE(logc.rows() == 21 and logc.cols() == 11);
    IS_TRUE(logc(4, 3) == analytical_log_marginal(x2s[4], x3s[3], p));

    const Mat2D dens = normalized_analytical_marginal(x2s, x3s, p);
    IS_TRUE(std::abs(trapezoid(dens, x2s, x3s) - 1.0) < 1e-12);
    IS_TRUE(dens.minCoeff() >= 0.0);

    // a grid far from the ridge, where every density underflows
    const Col far = Col::LinSpaced(5, 1000.0, 1001.0);
    THROWS(normalized_analytical_marginal(far, far, params(0.1, 1e-4)), NumericError);
}

void series_agrees_with_quadrature() {
    const ModelParameters p = params(0.2, 0.2);
    const LogPosterior lp(p, BOX);
    GridQuadrature quad(lp, 61);
    quad.run();

    // the box faces are outside the support, so compare on interior nodes only
    const Eigen::Index m = 59;
    const Col x2s = quad.grid().axis(1).segment(1, m);
    const Col x3s = quad.grid().axis(2).segment(1, m);
    const Mat2D q = quad.marginal(1, 2).block(1, 1, m, m);
    const Mat2D qn = q / trapezoid(q, x2s, x3s);
    const Mat2D cf = normalized_analytical_marginal(x2s, x3s, p);

    const float_type diff = (qn - cf).cwiseAbs().maxCoeff();
    std::cout << "max |closed form - quadrature|: " << diff << " (peak " << cf.maxCoeff() << ")" << std::endl;
    IS_TRUE(diff < 0.01 * cf.maxCoeff());

    Eigen::Index r1, c1, r2, c2;
    qn.maxCoeff(&r1, &c1);
    cf.maxCoeff(&r2, &c2);
    IS_TRUE(std::abs(x2s[r1] + x3s[c1] - (x2s[r2] + x3s[c2])) < 1e-9);
}

int main(void) {
    series_ridge();
    series_gaussian_identity();
    series_direct_integral();
    series_grid_forms();
    series_agrees_with_quadrature();
    return test_failures;
}
