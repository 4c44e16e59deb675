#ifndef FLOWPOST_H
#define FLOWPOST_H

#include <memory>
#include <optional>
#include <string>

#include <FlowPost/TypeDefs.h>
#include <FlowPost/Config.h>
#include <FlowPost/Model.h>
#include <FlowPost/Quadrature.h>
#include <FlowPost/Sampler.h>

namespace FLOW {
    class FlowDB; // see FlowDB.h

// A `FlowPost` manages one inference run: configuration, the three ways of computing
// the posterior, cross-checks between them, and export of the results.
//
// Conventions:
//  - internal state fields: _field_name
//  - private methods: _method_name()
//  - public methods: method_name()
class FlowPost {
    public:
        FlowPost();
        // default destructor - has to be defined where FlowDB is complete
        ~FlowPost();

        // read and validate the configuration file
        // @throws ConfigError
        void parse(const std::string & config_file, const size_t verbose = 0);

        // programmatic alternative to parse()
        void configure(const RunConfig & rc, const size_t verbose = 0);

        void set_database(const std::string & path);

        // grid evaluation + nested trapezoid integration
        void quadrature(const size_t verbose = 0);

        // run the chain; `seed` and `iterations` override the configuration when present
        void sample(
            const std::optional<size_t> seed,
            const std::optional<size_t> iterations,
            const size_t verbose = 0
        );

        // closed-form (x2, x3) marginal on the quadrature grid's x2 / x3 axes
        void closed_form(const size_t verbose = 0);

        // cross-check whichever results are available; a no-op with fewer than two
        void compare(const size_t verbose = 0);

        const RunConfig & config() const { return _config; }
        const LogPosterior & posterior() const;
        const GridQuadrature * quadrature_result() const { return _quadrature.get(); }
        // burned and thinned per the configuration
        const std::optional<SampleChain> & chain() const { return _chain; }
        const Mat2D & closed_form_log_density() const { return _closed_form; }

        // total variation between each flow's chain histogram and quadrature marginal
        // @throws NumericError unless both quadrature() and sample() have run
        FlowVector chain_vs_quadrature() const;

        // max |normalized closed form - quadrature 2-D marginal| over the interior (x2, x3) nodes
        // @throws NumericError unless both quadrature() and closed_form() have run
        float_type closed_form_vs_quadrature() const;

        // peak of the closed form, normalized the same way closed_form_vs_quadrature() does
        float_type closed_form_peak() const;

    private:
        RunConfig _config;
        bool _configured;
        std::unique_ptr<LogPosterior> _posterior;
        std::unique_ptr<GridQuadrature> _quadrature;
        std::optional<SampleChain> _chain;
        Mat2D _closed_form;
        std::unique_ptr<FlowDB> _db;

        void _require_configured() const;
        Eigen::Index _interior_nodes() const;
        Mat2D _interior_closed_form() const;
        FlowDB * _storage();
};

}

#endif // FLOWPOST_H
