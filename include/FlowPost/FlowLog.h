#ifndef FLOWPOST_FLOWLOG_H
#define FLOWPOST_FLOWLOG_H

#include <iostream>
#include <string>

#include <FlowPost/Config.h>
#include <FlowPost/Quadrature.h>
#include <FlowPost/Sampler.h>

namespace FLOW {

// Fixed-width text reports; everything goes to std::cerr unless told otherwise.
struct FlowLog {

    static void report_configuration(
        const RunConfig & rc,
        std::ostream & os = std::cerr
    );

    static void report_quadrature(
        const GridQuadrature & quad,
        std::ostream & os = std::cerr
    );

    // `chain` should already be burned / thinned as the caller wants it summarized
    static void report_chain(
        const SampleChain & chain,
        const size_t raw_iterations,
        const float_type raw_acceptance,
        std::ostream & os = std::cerr
    );

    // total variation distance between each flow's chain histogram and its quadrature marginal
    static void report_chain_vs_quadrature(
        const FlowVector & tv_distance,
        std::ostream & os = std::cerr
    );

    static void report_closed_form_vs_quadrature(
        const float_type max_abs_diff,
        const float_type peak_density,
        std::ostream & os = std::cerr
    );

    static void _print_flow_table_header(
        const std::string & first_col,
        std::ostream & os = std::cerr
    );

    inline static const int WIDTH = 12;
    inline static const std::string double_bar = "=========================================================================================";

    private:
        FlowLog() {};

};

}

#endif // FLOWPOST_FLOWLOG_H
