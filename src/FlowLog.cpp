#include <FlowPost/FlowLog.h>
#include <FlowPost/FlowUtil.h>

#include <cmath>
#include <iomanip>

using std::endl;
using std::setw;

namespace FLOW {

void FlowLog::_print_flow_table_header(
    const std::string & first_col,
    std::ostream & os
) {
    os << setw(WIDTH) << first_col;
    for (size_t d = 0; d < NFLOW; ++d) { os << setw(WIDTH) << ("x" + std::to_string(d + 1)); }
    os << endl;
}

void FlowLog::report_configuration(
    const RunConfig & rc,
    std::ostream & os
) {
    os << double_bar << endl << "Configuration" << endl << double_bar << endl;
    os << "  measurement y = " << rc.model.y << ", sigma = " << rc.model.sigma << ", sigma_e = " << rc.model.sigma_e << endl;
    _print_flow_table_header("", os);
    os << setw(WIDTH) << "incidence";
    for (size_t d = 0; d < NFLOW; ++d) { os << setw(WIDTH) << rc.model.M[d]; } os << endl;
    os << setw(WIDTH) << "lower";
    for (size_t d = 0; d < NFLOW; ++d) { os << setw(WIDTH) << rc.bounds.alpha[d]; } os << endl;
    os << setw(WIDTH) << "upper";
    for (size_t d = 0; d < NFLOW; ++d) { os << setw(WIDTH) << rc.bounds.beta[d]; } os << endl;
    os << "  grid_pts = " << rc.grid_pts << ", iterations = " << rc.iterations << ", step = " << rc.step
       << ", burn_in = " << rc.burn_in << ", thin = " << rc.thin << endl;
}

void FlowLog::report_quadrature(
    const GridQuadrature & quad,
    std::ostream & os
) {
    os << double_bar << endl << "Grid quadrature (" << quad.grid().grid_pts() << " points per axis)" << endl << double_bar << endl;
    os << "  log Z = " << quad.log_evidence() << "  (Z = " << quad.evidence() << ")" << endl;

    const FlowVector mu = quad.mean();
    _print_flow_table_header("", os);
    os << setw(WIDTH) << "mean";
    for (size_t d = 0; d < NFLOW; ++d) { os << setw(WIDTH) << mu[d]; } os << endl;
    os << setw(WIDTH) << "mode";
    for (size_t d = 0; d < NFLOW; ++d) {
        Eigen::Index imax;
        quad.marginal(d).maxCoeff(&imax);
        os << setw(WIDTH) << quad.grid().axis(d)[imax];
    }
    os << endl;
}

void FlowLog::report_chain(
    const SampleChain & chain,
    const size_t raw_iterations,
    const float_type raw_acceptance,
    std::ostream & os
) {
    os << double_bar << endl << "Metropolis chain" << endl << double_bar << endl;
    os << "  iterations = " << raw_iterations << ", acceptance rate = " << raw_acceptance
       << ", retained states = " << chain.size() << endl;
    if (chain.size() == 0) { return; }

    _print_flow_table_header("", os);
    os << setw(WIDTH) << "mean";
    for (size_t d = 0; d < NFLOW; ++d) { os << setw(WIDTH) << mean(chain.column(d)); } os << endl;
    os << setw(WIDTH) << "sd";
    for (size_t d = 0; d < NFLOW; ++d) {
        const Col c = chain.column(d);
        os << setw(WIDTH) << std::sqrt(variance(c, mean(c)));
    }
    os << endl;
    os << setw(WIDTH) << "median";
    for (size_t d = 0; d < NFLOW; ++d) { os << setw(WIDTH) << median(chain.column(d)); } os << endl;
    os << setw(WIDTH) << "2.5%";
    for (size_t d = 0; d < NFLOW; ++d) { os << setw(WIDTH) << quantile(chain.column(d), 0.025); } os << endl;
    os << setw(WIDTH) << "97.5%";
    for (size_t d = 0; d < NFLOW; ++d) { os << setw(WIDTH) << quantile(chain.column(d), 0.975); } os << endl;
}

void FlowLog::report_chain_vs_quadrature(
    const FlowVector & tv_distance,
    std::ostream & os
) {
    os << double_bar << endl << "Chain histogram vs quadrature marginal (total variation, lower is better)" << endl << double_bar << endl;
    _print_flow_table_header("", os);
    os << setw(WIDTH) << "TV";
    for (size_t d = 0; d < NFLOW; ++d) { os << setw(WIDTH) << tv_distance[d]; } os << endl;
}

void FlowLog::report_closed_form_vs_quadrature(
    const float_type max_abs_diff,
    const float_type peak_density,
    std::ostream & os
) {
    os << double_bar << endl << "Closed-form (x2, x3) marginal vs quadrature" << endl << double_bar << endl;
    os << "  max |closed form - quadrature| = " << max_abs_diff << "  (peak density " << peak_density;
    if (peak_density > 0) { os << ", " << 100.0 * max_abs_diff / peak_density << "% of peak"; }
    os << ")" << endl;
}

}
