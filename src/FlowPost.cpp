#include <FlowPost/FlowPost.h>
#include <FlowPost/Analytical.h>
#include <FlowPost/Errors.h>
#include <FlowPost/FlowDB.h>
#include <FlowPost/FlowLog.h>
#include <FlowPost/FlowUtil.h>

#include <gsl/gsl_rng.h>

#include <ctime>
#include <iostream>
#include <map>
#include <unistd.h>

using std::cerr;
using std::endl;
using std::string;

namespace FLOW {

FlowPost::FlowPost() : _configured(false) {}

FlowPost::~FlowPost() = default;

void FlowPost::parse(const string & config_file, const size_t verbose) {
    if (verbose > 0) { cerr << "Reading configuration from " << config_file << endl; }
    configure(JsonConfig(config_file).parse(), verbose);
}

void FlowPost::configure(const RunConfig & rc, const size_t verbose) {
    rc.validate();
    _config = rc;
    _posterior = std::make_unique<LogPosterior>(_config.model, _config.bounds);
    _quadrature.reset();
    _chain.reset();
    _closed_form.resize(0, 0);
    _configured = true;
    if (verbose > 0) { FlowLog::report_configuration(_config); }
}

void FlowPost::set_database(const string & path) {
    _config.database = path;
    _db.reset();
}

void FlowPost::_require_configured() const {
    if (not _configured) { throw ConfigError("no configuration loaded; call parse() or configure() first"); }
}

const LogPosterior & FlowPost::posterior() const {
    _require_configured();
    return *_posterior;
}

FlowDB * FlowPost::_storage() {
    if (not _config.database.has_value()) { return nullptr; }
    if (not _db) {
        _db = std::make_unique<FlowDB>(_config.database.value());
        _db->setup();
    }
    return _db.get();
}

void FlowPost::quadrature(const size_t verbose) {
    _require_configured();
    if (verbose > 0) {
        cerr << "Evaluating posterior on " << _config.grid_pts << "^3 grid points" << endl;
    }
    auto quad = std::make_unique<GridQuadrature>(*_posterior, _config.grid_pts);
    quad->run();
    _quadrature = std::move(quad);

    if (verbose > 0) { FlowLog::report_quadrature(*_quadrature); }

    if (FlowDB * db = _storage()) {
        const Grid & grid = _quadrature->grid();
        for (size_t d = 0; d < NFLOW; ++d) { db->write_marginal(d, grid.axis(d), _quadrature->marginal(d)); }
        for (size_t a = 0; a < NFLOW; ++a) {
            for (size_t b = a + 1; b < NFLOW; ++b) {
                db->write_marginal(a, b, grid.axis(a), grid.axis(b), _quadrature->marginal(a, b));
            }
        }
        db->write_summary({ { "log_evidence", _quadrature->log_evidence() } });
    }
}

void FlowPost::sample(
    const std::optional<size_t> seed,
    const std::optional<size_t> iterations,
    const size_t verbose
) {
    _require_configured();
    const size_t n = iterations.value_or(_config.iterations);
    if (_config.burn_in >= n) { throw ConfigError("burn-in is as long as the whole chain"); }

    std::unique_ptr<gsl_rng, void(*)(gsl_rng*)> rng(gsl_rng_alloc(gsl_rng_taus2), gsl_rng_free);
    if (seed.has_value()) {
        gsl_rng_set(rng.get(), seed.value());
    } else if (_config.seed.has_value()) {
        gsl_rng_set(rng.get(), _config.seed.value());
    } else {
        gsl_rng_set(rng.get(), time(NULL) * getpid()); // seed the rng using sys time and the process id
    }

    if (verbose > 0) { cerr << "Running " << n << " Metropolis iterations with step " << _config.step << endl; }

    const MetropolisSampler sampler(*_posterior, _config.step);
    const SampleChain raw = sampler.run(n, rng.get(), verbose);
    _chain = raw.burned(_config.burn_in).thinned(_config.thin);

    if (verbose > 0) { FlowLog::report_chain(_chain.value(), raw.size(), raw.acceptance_rate()); }

    if (FlowDB * db = _storage()) {
        db->write_chain(_chain.value(), verbose);
        db->write_summary({
            { "iterations", static_cast<float_type>(raw.size()) },
            { "acceptance_rate", raw.acceptance_rate() },
            { "step", _config.step }
        });
    }
}

void FlowPost::closed_form(const size_t verbose) {
    _require_configured();
    const Grid grid(_config.bounds, _config.grid_pts);
    _closed_form = analytical_log_marginal(grid.axis(1), grid.axis(2), _config.model);

    if (verbose > 0) {
        Eigen::Index r, c;
        const float_type best = _closed_form.maxCoeff(&r, &c);
        cerr << "Closed-form (x2, x3) log density peaks at (" << grid.axis(1)[r] << ", " << grid.axis(2)[c]
             << ") with value " << best << endl;
    }

    if (FlowDB * db = _storage()) { db->write_closed_form(grid.axis(1), grid.axis(2), _closed_form); }
}

FlowVector FlowPost::chain_vs_quadrature() const {
    if (not (_quadrature and _chain.has_value())) {
        throw NumericError("chain / quadrature comparison needs both results");
    }
    FlowVector tv;
    for (size_t d = 0; d < NFLOW; ++d) {
        const Col & coords = _quadrature->grid().axis(d);
        tv[d] = total_variation(histogram_density(_chain->column(d), coords), _quadrature->marginal(d), coords);
    }
    return tv;
}

Eigen::Index FlowPost::_interior_nodes() const {
    if (not (_quadrature and _closed_form.size() > 0)) {
        throw NumericError("closed-form / quadrature comparison needs both results");
    }
    const Eigen::Index m = static_cast<Eigen::Index>(_quadrature->grid().grid_pts()) - 2;
    if (m < 2) { throw NumericError("grid too coarse to compare interior marginals"); }
    return m;
}

// nodes on the faces of the box are outside the (open) support, so the quadrature marginal
// is 0 there while the closed form is not; both sides are renormalized over interior nodes
Mat2D FlowPost::_interior_closed_form() const {
    const Eigen::Index m = _interior_nodes();
    const Grid & grid = _quadrature->grid();
    return normalized_analytical_marginal(grid.axis(1).segment(1, m), grid.axis(2).segment(1, m), _config.model);
}

float_type FlowPost::closed_form_vs_quadrature() const {
    const Eigen::Index m = _interior_nodes();
    const Grid & grid = _quadrature->grid();
    const Col x2s = grid.axis(1).segment(1, m), x3s = grid.axis(2).segment(1, m);

    const Mat2D quad = _quadrature->marginal(1, 2).block(1, 1, m, m);
    const float_type zq = trapezoid(quad, x2s, x3s);
    if (not (zq > 0)) { throw NumericError("quadrature marginal has no mass on interior nodes"); }
    return (_interior_closed_form() - quad / zq).cwiseAbs().maxCoeff();
}

float_type FlowPost::closed_form_peak() const {
    return _interior_closed_form().maxCoeff();
}

void FlowPost::compare(const size_t verbose) {
    if (not _configured) { return; }
    std::map<string, float_type> summary;

    if (_quadrature and _chain.has_value()) {
        const FlowVector tv = chain_vs_quadrature();
        if (verbose > 0) { FlowLog::report_chain_vs_quadrature(tv); }
        for (size_t d = 0; d < NFLOW; ++d) { summary["tv_x" + std::to_string(d + 1)] = tv[d]; }
    }

    if (_quadrature and _closed_form.size() > 0) {
        const float_type diff = closed_form_vs_quadrature();
        if (verbose > 0) { FlowLog::report_closed_form_vs_quadrature(diff, closed_form_peak()); }
        summary["closed_form_max_abs_diff"] = diff;
    }

    if (not summary.empty()) {
        if (FlowDB * db = _storage()) { db->write_summary(summary); }
    }
}

}
