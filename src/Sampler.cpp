#include <FlowPost/Sampler.h>
#include <FlowPost/Errors.h>

#include <gsl/gsl_randist.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace FLOW {

void SampleChain::append(const ChainState & state, const bool accepted) {
    if (_size == capacity()) {
        // grow geometrically if the caller under-sized the chain
        _samples.conservativeResize(std::max<size_t>(2 * _size, 1), NFLOW);
    }
    _samples.row(_size) = state.position.transpose();
    ++_size;
    if (accepted) { ++_accepted; }
}

FlowVector SampleChain::at(const size_t i) const {
    if (i >= _size) { throw std::out_of_range("chain index out of range"); }
    return _samples.row(i).transpose();
}

SampleChain SampleChain::burned(const size_t n) const {
    const size_t keep = (n < _size) ? _size - n : 0;
    SampleChain out(keep);
    out._samples = _samples.middleRows(_size - keep, keep);
    out._size = keep;
    return out;
}

SampleChain SampleChain::thinned(const size_t k) const {
    if (k == 0) { throw std::invalid_argument("thinning interval must be positive"); }
    const size_t keep = (_size + k - 1) / k;
    SampleChain out(keep);
    for (size_t i = 0; i < keep; ++i) { out._samples.row(i) = _samples.row(i * k); }
    out._size = keep;
    return out;
}

MetropolisSampler::MetropolisSampler(
    const LogPosterior & posterior,
    const float_type step
) : _posterior(posterior), _step(step) {
    if (not (std::isfinite(step) and step > 0)) { throw ConfigError("proposal half-width must be positive"); }
}

ChainState MetropolisSampler::initial_state() const {
    const FlowVector start = _posterior.bounds().midpoint();
    const float_type logp = _posterior(start);
    if (logp == LOG_ZERO) {
        std::stringstream ss;
        ss << "starting point (" << start.transpose() << ") is outside the posterior support";
        throw InitializationError(ss.str());
    }
    return { start, logp };
}

FlowVector MetropolisSampler::propose(const FlowVector & current, const gsl_rng * rng) const {
    FlowVector candidate;
    for (size_t i = 0; i < NFLOW; ++i) {
        candidate[i] = gsl_ran_flat(rng, current[i] - _step, current[i] + _step);
    }
    return candidate;
}

bool MetropolisSampler::accept(
    const float_type log_p_current,
    const float_type log_p_candidate,
    const float_type u
) {
    if (log_p_candidate == LOG_ZERO) { return false; }
    const float_type delta = log_p_candidate - log_p_current;
    return std::log(u) < std::min(0.0, delta);
}

ChainState MetropolisSampler::transition(
    const ChainState & state,
    const FlowVector & candidate,
    const float_type u,
    bool * accepted
) const {
    const float_type logp = _posterior(candidate);
    const bool moved = accept(state.log_density, logp, u);
    if (accepted) { *accepted = moved; }
    return moved ? ChainState{ candidate, logp } : state;
}

ChainState MetropolisSampler::step(
    const ChainState & state,
    const gsl_rng * rng,
    bool * accepted
) const {
    const FlowVector candidate = propose(state.position, rng);
    // uniform_pos never returns 0, so log(u) is always finite
    const float_type u = gsl_rng_uniform_pos(rng);
    return transition(state, candidate, u, accepted);
}

SampleChain MetropolisSampler::run(
    const size_t iterations,
    const gsl_rng * rng,
    const size_t verbose
) const {
    if (iterations == 0) { throw ConfigError("sampler iteration count must be positive"); }

    SampleChain chain(iterations);
    ChainState state = initial_state();
    const size_t report_every = std::max<size_t>(iterations / 10, 1);

    for (size_t it = 0; it < iterations; ++it) {
        bool moved = false;
        state = step(state, rng, &moved);
        chain.append(state, moved);
        if (verbose > 1 and (it + 1) % report_every == 0) {
            std::cerr << "  iteration " << (it + 1) << " / " << iterations
                      << ", acceptance rate " << chain.acceptance_rate() << std::endl;
        }
    }
    return chain;
}

}
