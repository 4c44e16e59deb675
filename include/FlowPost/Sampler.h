#ifndef FLOWPOST_SAMPLER_H
#define FLOWPOST_SAMPLER_H

#include <gsl/gsl_rng.h>

#include <FlowPost/TypeDefs.h>
#include <FlowPost/Model.h>

namespace FLOW {

// current position of the chain and its log density
struct ChainState {
    FlowVector position;
    float_type log_density;
};

// SampleChain: one row per iteration, in order; rejected proposals are recorded as
// repeats of the previous state. Storage is allocated up front for the full run.
class SampleChain {
    public:
        SampleChain() : _samples(0, NFLOW), _size(0), _accepted(0) {}
        explicit SampleChain(const size_t capacity) : _samples(capacity, NFLOW), _size(0), _accepted(0) {}

        void append(const ChainState & state, const bool accepted);

        size_t size() const { return _size; }
        size_t capacity() const { return static_cast<size_t>(_samples.rows()); }
        size_t accepted() const { return _accepted; }
        float_type acceptance_rate() const { return _size == 0 ? 0.0 : static_cast<float_type>(_accepted) / _size; }

        FlowVector at(const size_t i) const;

        // rows = iterations, cols = flows
        Mat2D samples() const { return _samples.topRows(_size); }
        Col column(const size_t dim) const { return _samples.col(dim).head(_size); }

        // chain without its first `n` states (burn-in); the acceptance count is not carried over
        SampleChain burned(const size_t n) const;
        // every `k`th state, starting from the first
        SampleChain thinned(const size_t k) const;

    private:
        Mat2D _samples;
        size_t _size;
        size_t _accepted;
};

// MetropolisSampler: single-chain random-walk Metropolis over the bounded posterior.
//
// Each coordinate is perturbed independently by flat(-step, +step). A proposal outside
// the box has log density LOG_ZERO, so it is always rejected; no separate bounds check.
//
// The sampler keeps its own copy of the posterior and no chain state; callers either loop
// over step() themselves or use run().
class MetropolisSampler {
    public:
        static constexpr float_type DEFAULT_STEP = 0.29;
        static constexpr size_t DEFAULT_ITERATIONS = 1500000;

        MetropolisSampler(const LogPosterior & posterior, const float_type step = DEFAULT_STEP);

        float_type get_step() const { return _step; }
        const LogPosterior & posterior() const { return _posterior; }

        // midpoint of the box
        // @throws InitializationError if the midpoint has zero posterior density
        ChainState initial_state() const;

        FlowVector propose(const FlowVector & current, const gsl_rng * rng) const;

        // Metropolis rule: log(u) < min(0, log_p_candidate - log_p_current); u must be in (0, 1)
        static bool accept(const float_type log_p_current, const float_type log_p_candidate, const float_type u);

        // deterministic half of a transition, given a proposal and the uniform draw
        ChainState transition(const ChainState & state, const FlowVector & candidate, const float_type u, bool * accepted = nullptr) const;

        // one full transition: propose, evaluate, accept or stay
        ChainState step(const ChainState & state, const gsl_rng * rng, bool * accepted = nullptr) const;

        // run `iterations` transitions from initial_state()
        SampleChain run(const size_t iterations, const gsl_rng * rng, const size_t verbose = 0) const;

    private:
        const LogPosterior _posterior;
        const float_type _step;
};

}

#endif // FLOWPOST_SAMPLER_H
