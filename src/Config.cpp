#include <FlowPost/Config.h>
#include <FlowPost/Errors.h>
#include <FlowPost/FlowUtil.h>
#include <FlowPost/Grid.h>

#include <filesystem> // exists
#include <iostream>

using std::string;
using std::vector;

namespace {

Json::Value prepare(const string & json_data, const string & source) {
    Json::Value par;   // will contain the par value after parsing.
    Json::Reader reader;
    if ( !reader.parse( json_data, par ) ) {
        // report to the user the failure and their locations in the document.
        throw FLOW::ConfigError("failed to parse " + source + "\n" + reader.getFormattedErrorMessages());
    }
    if (not par.isObject()) { throw FLOW::ConfigError(source + " must hold a JSON object"); }
    return par;
}

const Json::Value & required(const Json::Value & par, const string & key) {
    if (not par.isMember(key)) { throw FLOW::ConfigError("missing required entry `" + key + "`"); }
    return par[key];
}

// three values, or one value broadcast to all flows
FLOW::FlowVector as_flow_vector(const Json::Value & val, const string & key) {
    const vector<float_type> vals = as_vector<float_type>(val);
    if (vals.size() == 1) { return FLOW::FlowVector::Constant(vals[0]); }
    if (vals.size() != FLOW::NFLOW) {
        throw FLOW::ConfigError("`" + key + "` must be a number or an array of " + std::to_string(FLOW::NFLOW) + " numbers");
    }
    return FLOW::FlowVector(vals[0], vals[1], vals[2]);
}

size_t as_count(const Json::Value & val, const string & key) {
    if (not val.isIntegral() or val.asInt64() < 0) { throw FLOW::ConfigError("`" + key + "` must be a non-negative integer"); }
    return static_cast<size_t>(val.asUInt64());
}

}

namespace FLOW {

void RunConfig::validate() const {
    model.validate();
    bounds.validate();
    if (grid_pts < 2) { throw ConfigError("`grid_pts` must be at least 2"); }
    if (grid_pts > Grid::MAX_GRID_PTS) {
        throw ConfigError("`grid_pts` must be at most " + std::to_string(Grid::MAX_GRID_PTS));
    }
    if (iterations == 0) { throw ConfigError("`mcmc.iterations` must be positive"); }
    if (not (step > 0)) { throw ConfigError("`mcmc.step` must be positive"); }
    if (thin == 0) { throw ConfigError("`mcmc.thin` must be positive"); }
    if (burn_in >= iterations) { throw ConfigError("`mcmc.burn_in` must be less than `mcmc.iterations`"); }
}

JsonConfig::JsonConfig(const string & filename) : _root(
    std::filesystem::exists(filename) ?
        prepare(slurp(filename), filename) :
        throw ConfigError("file does not exist: " + filename)
) {}

JsonConfig JsonConfig::from_string(const string & json_data) {
    return JsonConfig(prepare(json_data, "configuration"));
}

RunConfig JsonConfig::parse() const {
    RunConfig rc;
    try {
        rc.model.y = required(_root, "measurement").asDouble();
        rc.model.sigma = required(_root, "sigma").asDouble();
        rc.model.sigma_e = required(_root, "sigma_e").asDouble();
        if (_root.isMember("incidence")) {
            rc.model.M = as_flow_vector(_root["incidence"], "incidence");
        }

        rc.bounds.alpha = as_flow_vector(required(_root, "lower_bounds"), "lower_bounds");
        rc.bounds.beta = as_flow_vector(required(_root, "upper_bounds"), "upper_bounds");

        if (_root.isMember("grid_pts")) { rc.grid_pts = as_count(_root["grid_pts"], "grid_pts"); }

        if (_root.isMember("mcmc")) {
            const Json::Value & mcmc = _root["mcmc"];
            if (not mcmc.isObject()) { throw ConfigError("`mcmc` must be an object"); }
            if (mcmc.isMember("iterations")) { rc.iterations = as_count(mcmc["iterations"], "mcmc.iterations"); }
            rc.step = mcmc.get("step", rc.step).asDouble();
            if (mcmc.isMember("burn_in")) { rc.burn_in = as_count(mcmc["burn_in"], "mcmc.burn_in"); }
            if (mcmc.isMember("thin")) { rc.thin = as_count(mcmc["thin"], "mcmc.thin"); }
            if (mcmc.isMember("seed")) { rc.seed = as_count(mcmc["seed"], "mcmc.seed"); }
        }

        if (_root.isMember("database_filename")) {
            rc.database = _root["database_filename"].asString();
        }
    } catch (const Json::Exception & e) {
        // jsoncpp throws on type mismatches, e.g. a string where a number belongs
        throw ConfigError(string("malformed entry: ") + e.what());
    }

    rc.validate();
    return rc;
}

}
