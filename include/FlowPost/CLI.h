#ifndef FLOWPOST_CLI_H
#define FLOWPOST_CLI_H

#include <iostream>
#include <vector>
#include <optional>
#include <string>

using std::cerr;
using std::endl;
using std::string;

namespace FLOW {

// A "usage" function for the built-in FlowPost CLI
// @param cmd the name of the executable
// @param msg an optional message to print before the usage
// @param status if non-zero, will exit with this status
void usage(
    const string &cmd,
    const string &msg = "",
    const int status = 0
);

// Enum for the ways of computing the posterior
// QUADRATURE: evaluate on a grid, integrate for the evidence and marginals
// SAMPLE: run the random-walk Metropolis chain
// CLOSED_FORM: evaluate the analytical (x2, x3) marginal
enum STEP { QUADRATURE, SAMPLE, CLOSED_FORM };

// Stream insertion operator for FLOW::STEP
std::ostream& operator<<(std::ostream &os, const STEP &step);

// Container for the parsed command line arguments
// @var config_file the path to the configuration file
// @var steps the `STEP`s to perform
// @var seed the sampler seed (overrides the configuration file)
// @var iterations the chain length (overrides the configuration file)
// @var database the results database (overrides the configuration file)
// @var verbose the verbosity level (0 = quiet, 1 = normal, 2 = progress)
struct CLIArgs {
    CLIArgs() = delete;
    CLIArgs(const string & cf) : config_file(cf) {};

    string config_file;                  // based on config file ...
    std::vector<STEP> steps = {};        // ... do nothing by default
    std::optional<size_t> seed;          // ... with the configured seed
    std::optional<size_t> iterations;    // ... for the configured chain length
    std::optional<string> database;      // ... exporting where configured
    size_t verbose = 0;                  // ... quietly
    bool help = false;
};

// parses the args passed to a typical main() function for a FlowPost program
// @param argc the number of arguments (per typical main() signature)
// @param argv the arguments (per typical main() signature)
CLIArgs parse_args(const size_t argc, const char * argv[]);

// Runs a FlowPost analysis, for some object that implements the *verbs*:
// - parse(a string [configuration file path], a size_t [verbosity level])
// - set_database(a string [results database path])
// - quadrature(a verbosity level)
// - sample(an optional seed, an optional chain length, a verbosity level)
// - closed_form(a verbosity level)
// - compare(a verbosity level) n.b. cross-checks whatever the steps produced
template<typename APP>
inline void run(
    APP* app, const CLIArgs &args
) {
    if (args.help) { return; }

    app->parse(args.config_file, args.verbose);
    if (args.database.has_value()) { app->set_database(args.database.value()); }

    if (args.verbose > 0) {
        cerr << "Running FlowPost as: " << endl;
        for (auto it = args.steps.begin(); it != args.steps.end(); it++) {
            if (it != args.steps.begin()) { cerr << " => "; }
            cerr << *it;
        }
        cerr << endl;
    }

    for (auto step : args.steps) {
        switch(step) {
            case QUADRATURE: app->quadrature(args.verbose); break;
            case SAMPLE: app->sample(args.seed, args.iterations, args.verbose); break;
            case CLOSED_FORM: app->closed_form(args.verbose); break;
            default:
                cerr << "Hit unimplemented STEP." << endl;
                exit(-1);
        }
    }

    app->compare(args.verbose);
};

}

#endif // FLOWPOST_CLI_H
