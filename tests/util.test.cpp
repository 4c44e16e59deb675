#include "testing.h"
#include <FlowPost/FlowUtil.h>
#include <FlowPost/Errors.h>

#include <cmath>

using namespace FLOW;

Col col(std::initializer_list<float_type> vals) {
    Col c(vals.size());
    Eigen::Index i = 0;
    for (const float_type v : vals) { c[i++] = v; }
    return c;
}

void series_summary_statistics() {
    const Col data = col({ 4.0, 1.0, 3.0, 2.0, 5.0 });
    IS_TRUE(mean(data) == 3.0);
    IS_TRUE(median(data) == 3.0);
    IS_TRUE(median(col({ 4.0, 1.0, 3.0, 2.0 })) == 2.5);
    IS_TRUE(quantile(data, 0.0) == 1.0);
    IS_TRUE(quantile(data, 1.0) == 5.0);
    IS_TRUE(std::abs(quantile(data, 0.1) - 1.4) < 1e-12);
    IS_TRUE(variance(data, mean(data)) == 2.5);
    IS_TRUE(variance(col({ 1.0 }), 1.0) == 0.0);

    THROWS(quantile(Col(0), 0.5), std::invalid_argument);
    THROWS(quantile(data, 1.5), std::invalid_argument);
}

void series_trapezoid() {
    const Col x = Col::LinSpaced(11, 0.0, 2.0);
    // exact for linear integrands
    IS_TRUE(std::abs(trapezoid((3.0 * x.array() + 1.0).matrix(), x) - 8.0) < 1e-12);
    // second-order for smooth ones: error h^2 (b - a) f'' / 12
    const float_type err = trapezoid(x.array().square().matrix(), x) - 8.0 / 3.0;
    IS_TRUE(std::abs(err - 0.04 * 2.0 * 2.0 / 12.0) < 1e-12);

    const Col y = Col::LinSpaced(5, -1.0, 1.0);
    const Mat2D ones = Mat2D::Ones(x.size(), y.size());
    IS_TRUE(std::abs(trapezoid(ones, x, y) - 4.0) < 1e-12);

    THROWS(trapezoid(Col::Ones(3), x), std::invalid_argument);
    THROWS(trapezoid(ones, y, x), std::invalid_argument);
}

void series_histogram_density() {
    const Col coords = Col::LinSpaced(5, 0.0, 1.0);   // spacing 0.25
    const Col samples = col({ 0.0, 0.1, 0.3, 0.5, 0.55, 0.99, 1.0, -0.2, 1.7 });
    const Col dens = histogram_density(samples, coords);

    // the two samples outside the range are dropped; 7 remain
    // node counts: 0.0 -> {0.0, 0.1}, 0.25 -> {0.3}, 0.5 -> {0.5, 0.55}, 1.0 -> {0.99, 1.0}
    IS_TRUE(std::abs(dens[0] - 2.0 / (7.0 * 0.125)) < 1e-12);
    IS_TRUE(std::abs(dens[1] - 1.0 / (7.0 * 0.25)) < 1e-12);
    IS_TRUE(std::abs(dens[2] - 2.0 / (7.0 * 0.25)) < 1e-12);
    IS_TRUE(dens[3] == 0.0);
    IS_TRUE(std::abs(dens[4] - 2.0 / (7.0 * 0.125)) < 1e-12);
    IS_TRUE(std::abs(trapezoid(dens, coords) - 1.0) < 1e-12);

    IS_TRUE(histogram_density(col({ 5.0 }), coords).isZero());
    THROWS(histogram_density(samples, col({ 0.0 })), std::invalid_argument);
}

void series_total_variation() {
    const Col coords = Col::LinSpaced(3, 0.0, 1.0);
    const Col p = col({ 0.0, 1.0, 2.0 });
    const Col q = col({ 2.0, 1.0, 0.0 });
    IS_TRUE(total_variation(p, p, coords) == 0.0);
    IS_TRUE(std::abs(total_variation(p, q, coords) - 0.5) < 1e-12);
    THROWS(total_variation(p, Col::Ones(2), coords), std::invalid_argument);
}

void series_slurp() {
    THROWS(slurp("no/such/file.txt"), ConfigError);
}

int main(void) {
    series_summary_statistics();
    series_trapezoid();
    series_histogram_density();
    series_total_variation();
    series_slurp();
    return test_failures;
}
