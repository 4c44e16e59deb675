#ifndef FLOWPOST_CONFIG_H
#define FLOWPOST_CONFIG_H

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

#include <FlowPost/TypeDefs.h>
#include <FlowPost/Model.h>

template <NumericType T>
std::vector<T> as_vector(const Json::Value & val) {
    std::vector<T> extracted_vals;
    if (val.isArray()) { for (const Json::Value & jv : val) {
        extracted_vals.push_back( jv.as<T>() ); // NB, jsoncpp handles cast failures
    } } else {
        extracted_vals.push_back( val.as<T>() );
    }
    return extracted_vals;
}

namespace FLOW {

// Everything needed for one inference run; immutable once built.
struct RunConfig {
    ModelParameters model;
    Bounds bounds;
    size_t grid_pts = 100;
    size_t iterations = 1500000;
    float_type step = 0.29;
    size_t burn_in = 0;
    size_t thin = 1;
    std::optional<size_t> seed;             // unset => seeded from time and pid
    std::optional<std::string> database;    // unset => no export

    // @throws ConfigError on any inconsistent setting
    void validate() const;
};

struct Config {
    virtual ~Config() = default;
    virtual RunConfig parse() const = 0;
};

// JSON configuration; see `examples/splitter.json`
struct JsonConfig : public Config {
    // @throws ConfigError if the file is missing or not valid JSON
    explicit JsonConfig(const std::string & filename);
    explicit JsonConfig(const Json::Value & root) : _root(root) {}

    static JsonConfig from_string(const std::string & json_data);

    // @throws ConfigError on missing, mistyped or invalid entries
    RunConfig parse() const override;

    private:
        const Json::Value _root;
};

}

#endif // FLOWPOST_CONFIG_H
