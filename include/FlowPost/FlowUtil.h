#ifndef FLOWPOST_FLOWUTIL_H
#define FLOWPOST_FLOWUTIL_H

#include <iostream>
#include <string>
#include <vector>

#include <FlowPost/TypeDefs.h>

namespace FLOW {

    std::string slurp(const std::string & filename);

    inline float_type mean(const Col & data) { return data.mean(); }

    float_type median(const Col & data);

    // linear interpolation between order statistics; q in [0, 1]
    float_type quantile(const Col & data, const float_type q);

    float_type variance(const Col & data, const float_type _mean);

    // integral of y(x) by the composite trapezoidal rule
    float_type trapezoid(const Col & y, const Col & x);

    // double integral of z(x[r], y[c]) by the composite trapezoidal rule in each direction
    float_type trapezoid(const Mat2D & z, const Col & x, const Col & y);

    // Histogram density estimate on a uniform grid: each sample is counted at the nearest
    // coordinate, bins are centred on the coordinates and the two end bins are half-width.
    // Samples outside [coords[0], coords[n-1]] are ignored.
    Col histogram_density(const Col & samples, const Col & coords);

    // 0.5 * integral |p - q| over the coordinates; 0 for identical densities, 1 for disjoint ones
    float_type total_variation(const Col & p, const Col & q, const Col & coords);

    template <typename T>
    inline void cerr_vector(const std::vector<T> & my_vector, const std::string sep = " ") {
        for (size_t i = 0; i + 1 < my_vector.size(); i++ ) std::cerr << my_vector[i] << sep;
        if (not my_vector.empty()) std::cerr << my_vector.back();
    }

}

#endif // FLOWPOST_FLOWUTIL_H
