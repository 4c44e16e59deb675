#include "testing.h"
#include <FlowPost/Config.h>
#include <FlowPost/Errors.h>
#include <FlowPost/Grid.h>

#include <filesystem>
#include <fstream>

using namespace FLOW;
using std::string;

const string BASE = R"({
    "measurement" : 1.5,
    "sigma" : 0.1,
    "sigma_e" : 1e-4,
    "lower_bounds" : 0,
    "upper_bounds" : [3, 3, 3]
})";

// BASE with `entries` appended to the object
string with(const string & entries) {
    string json = BASE;
    json.insert(json.rfind('}'), ", " + entries);
    return json;
}

void series_defaults() {
    const RunConfig rc = JsonConfig::from_string(BASE).parse();
    IS_TRUE(rc.model.y == 1.5);
    IS_TRUE(rc.model.sigma == 0.1);
    IS_TRUE(rc.model.sigma_e == 1e-4);
    IS_TRUE(rc.model.M == FlowVector(1.0, -1.0, -1.0));
    IS_TRUE(rc.bounds.alpha == FlowVector::Zero());          // scalar broadcast
    IS_TRUE(rc.bounds.beta == FlowVector::Constant(3.0));
    IS_TRUE(rc.grid_pts == 100);
    IS_TRUE(rc.iterations == 1500000);
    IS_TRUE(rc.step == 0.29);
    IS_TRUE(rc.burn_in == 0 and rc.thin == 1);
    IS_TRUE(not rc.seed.has_value());
    IS_TRUE(not rc.database.has_value());
}

void series_overrides() {
    const RunConfig rc = JsonConfig::from_string(with(R"(
        "incidence" : [1, -1, -2],
        "grid_pts" : 41,
        "mcmc" : { "iterations" : 20000, "step" : 0.1, "burn_in" : 500, "thin" : 4, "seed" : 99 },
        "database_filename" : "out.sqlite"
    )")).parse();
    IS_TRUE(rc.model.M == FlowVector(1.0, -1.0, -2.0));
    IS_TRUE(rc.grid_pts == 41);
    IS_TRUE(rc.iterations == 20000);
    IS_TRUE(rc.step == 0.1);
    IS_TRUE(rc.burn_in == 500 and rc.thin == 4);
    IS_TRUE(rc.seed.value() == 99);
    IS_TRUE(rc.database.value() == "out.sqlite");
}

void series_invalid() {
    // not JSON, or not an object
    THROWS(JsonConfig::from_string("{ \"sigma\" : "), ConfigError);
    THROWS(JsonConfig::from_string("[1, 2, 3]"), ConfigError);

    // missing entries
    THROWS(JsonConfig::from_string(R"({ "sigma" : 0.1, "sigma_e" : 0.1, "lower_bounds" : 0, "upper_bounds" : 3 })").parse(), ConfigError);
    THROWS(JsonConfig::from_string(R"({ "measurement" : 1.5, "sigma" : 0.1, "sigma_e" : 0.1, "lower_bounds" : 0 })").parse(), ConfigError);

    // mistyped entries
    THROWS(JsonConfig::from_string(R"({ "measurement" : 1.5, "sigma" : "wide", "sigma_e" : 0.1, "lower_bounds" : 0, "upper_bounds" : 3 })").parse(), ConfigError);
    THROWS(JsonConfig::from_string(with(R"("grid_pts" : 2.5)")).parse(), ConfigError);
    THROWS(JsonConfig::from_string(with(R"("mcmc" : 5)")).parse(), ConfigError);
    THROWS(JsonConfig::from_string(with(R"("mcmc" : { "seed" : -1 })")).parse(), ConfigError);
    THROWS(JsonConfig::from_string(with(R"("incidence" : [1, -1])")).parse(), ConfigError);

    // well-formed but inconsistent
    THROWS(JsonConfig::from_string(R"({ "measurement" : 1.5, "sigma" : 0, "sigma_e" : 0.1, "lower_bounds" : 0, "upper_bounds" : 3 })").parse(), ConfigError);
    THROWS(JsonConfig::from_string(R"({ "measurement" : 1.5, "sigma" : 0.1, "sigma_e" : -0.1, "lower_bounds" : 0, "upper_bounds" : 3 })").parse(), ConfigError);
    THROWS(JsonConfig::from_string(R"({ "measurement" : 1.5, "sigma" : 0.1, "sigma_e" : 0.1, "lower_bounds" : [0, 4, 0], "upper_bounds" : 3 })").parse(), ConfigError);
    THROWS(JsonConfig::from_string(with(R"("grid_pts" : 1)")).parse(), ConfigError);
    THROWS(JsonConfig::from_string(with(R"("grid_pts" : 1001)")).parse(), ConfigError);
    THROWS(JsonConfig::from_string(with(R"("grid_pts" : 4194304)")).parse(), ConfigError);
    THROWS(JsonConfig::from_string(with(R"("mcmc" : { "step" : 0 })")).parse(), ConfigError);
    THROWS(JsonConfig::from_string(with(R"("mcmc" : { "thin" : 0 })")).parse(), ConfigError);
    THROWS(JsonConfig::from_string(with(R"("mcmc" : { "iterations" : 100, "burn_in" : 100 })")).parse(), ConfigError);
}

void series_grid_cap() {
    RunConfig rc = JsonConfig::from_string(with(R"("grid_pts" : 1000)")).parse();
    IS_TRUE(rc.grid_pts == Grid::MAX_GRID_PTS);
    rc.validate();

    // 2^22 cubed wraps a 64-bit size to 0
    rc.grid_pts = size_t(1) << 22;
    THROWS(rc.validate(), ConfigError);
    rc.grid_pts = 5000;
    THROWS(rc.validate(), ConfigError);
}

void series_files() {
    THROWS(JsonConfig(std::string("no/such/config.json")), ConfigError);

    const std::filesystem::path path = std::filesystem::temp_directory_path() / "flowpost_config_test.json";
    {
        std::ofstream out(path);
        out << with(R"("mcmc" : { "seed" : 7 })");
    }
    const RunConfig rc = JsonConfig(path.string()).parse();
    IS_TRUE(rc.seed.value() == 7);
    IS_TRUE(rc.bounds.beta == FlowVector::Constant(3.0));
    std::filesystem::remove(path);
}

int main(void) {
    series_defaults();
    series_overrides();
    series_invalid();
    series_grid_cap();
    series_files();
    return test_failures;
}
