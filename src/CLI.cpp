#include <FlowPost/CLI.h>

#include <cstdlib>
#include <cstring>
#include <algorithm>

using std::cerr;
using std::endl;
using std::string;

namespace FLOW {

void usage(
    const string &cmd,
    const string &msg,
    const int status
) {
    const string ident = "\t";
    if (not msg.empty()) { cerr << msg << endl; }
    cerr << "Usage: " << cmd << " config.json [-option|--option (each space separated)]" << endl << endl;
    cerr << "Core options:" << endl;
    cerr << ident << "-(-q)uadrature  : evaluate the posterior on a grid; report evidence and marginals." << endl;
    cerr << ident << "-(-s)ample      : run the random-walk Metropolis chain." << endl;
    cerr << ident << "-(-c)losed-form : evaluate the analytical (x2, x3) marginal." << endl;
    cerr << ident << "-(-a)ll         : implies -q -s -c." << endl;
    cerr << endl;
    cerr << "Auxilary options:" << endl;
    cerr << ident << "-n 1234         : chain length; overrides the configuration file; implies -s." << endl;
    cerr << ident << "--seed 1234     : sampler seed (0 or more); overrides the configuration file." << endl;
    cerr << ident << "-o results.sqlite : results database; overrides the configuration file." << endl;
    cerr << ident << "-(-h)elp        : print this message; ignore all other options." << endl;
    cerr << ident << "-(-v)erbose     : when working, be effusive; repeat for progress reports." << endl;
    cerr << endl;
    cerr << "Example uses:" << endl;
    cerr << endl;
    cerr << "$ " << cmd << " config.json -a -v # all three methods, with cross-checks" << endl;
    cerr << "$ " << cmd << " config.json -s -n 100000 --seed 7 -o chain.sqlite # a short reproducible chain" << endl;
    if (status != 0) { exit(status); }
}

std::ostream& operator<<(std::ostream &os, const STEP &step) {
    switch (step) {
        case QUADRATURE: os << "QUADRATURE"; break;
        case SAMPLE: os << "SAMPLE"; break;
        case CLOSED_FORM: os << "CLOSED_FORM"; break;
        default: os << "UNDEFINED FLOW::STEP"; exit(-1);
    }
    return os;
}

// non-exported helper function for finding argument flags
bool argcheck(const char * arg, const char * short_arg, const char * long_arg) {
    return (strcmp(arg, short_arg) == 0) or (strcmp(arg, long_arg) == 0);
}

// non-exported helper: the integer (at least `min_val`) following flag `argv[i]`
size_t count_arg(const string & cmd, const size_t argc, const char * argv[], size_t & i, const long long min_val) {
    const string flag = argv[i];
    const string msg = "Error: " + flag + " must be followed by an integer >= " + std::to_string(min_val) + ".";
    // this will occur if the flag is the last argument, i.e. no number provided after
    if (i == (argc - 1)) { usage(cmd, msg, 103); }
    char * end = nullptr;
    const char * text = argv[++i];
    const long long val = strtoll(text, &end, 10);
    // this will occur if provided a number below the minimum, a non-integer, or nothing at all
    if (end == text or *end != '\0' or val < min_val) { usage(cmd, msg, 103); }
    return static_cast<size_t>(val);
}

void add_step(CLIArgs & args, const STEP step) {
    if (std::find(args.steps.begin(), args.steps.end(), step) != args.steps.end()) {
        cerr << "WARNING: " << step << " specified multiple times; ignoring redundant invocation." << endl;
    } else {
        args.steps.push_back(step);
    }
}

CLIArgs parse_args(const size_t argc, const char * argv[]) {

    // assert argv[0] = this program
    const string cmd = string(argv[0]);

    // check for help requested
    for (size_t i = 1; i < argc; i++) {
        if (argcheck(argv[i], "-h", "--help")) {
            usage(cmd);
            auto args = CLIArgs("");
            args.help = true;
            return args;
        }
    }

    // argv[1] = config file, if not in "help" mode
    if (argc < 2) { usage(cmd, "Error: no configuration file given.", 101); }

    auto args = CLIArgs(string(argv[1]));

    for (size_t i = 2; i < argc; i++) {

        if (argcheck(argv[i], "-q", "--quadrature")) {
            add_step(args, QUADRATURE);
        } else if (argcheck(argv[i], "-s", "--sample")) {
            add_step(args, SAMPLE);
        } else if (argcheck(argv[i], "-c", "--closed-form")) {
            add_step(args, CLOSED_FORM);
        } else if (argcheck(argv[i], "-a", "--all")) {
            if (args.steps.size() > 0) { usage(cmd, "Error: -(-a)ll cannot be combined with other steps.", 102); }
            args.steps = { QUADRATURE, SAMPLE, CLOSED_FORM };
        } else if (strcmp(argv[i], "-n") == 0) {
            args.iterations.emplace(count_arg(cmd, argc, argv, i, 1));
            if (std::find(args.steps.begin(), args.steps.end(), SAMPLE) == args.steps.end()) { args.steps.push_back(SAMPLE); }
        } else if (strcmp(argv[i], "--seed") == 0) {
            args.seed.emplace(count_arg(cmd, argc, argv, i, 0));
        } else if (strcmp(argv[i], "-o") == 0) {
            if (i == (argc - 1)) { usage(cmd, "Error: -o must be followed by a file name.", 103); }
            args.database.emplace(argv[++i]);
        } else if (argcheck(argv[i], "-v", "--verbose")) {
            args.verbose += 1;
        } else {
            usage(cmd, "Error: unrecognized argument: " + string(argv[i]), 104);
        }
    }

    if (args.steps.empty()) { usage(cmd, "Error: nothing to do; give at least one of -q, -s, -c, -a.", 105); }

    return args;
};

} // namespace FLOW
