#ifndef FLOWPOST_TYPEDEFS_H
#define FLOWPOST_TYPEDEFS_H

#include <concepts> // let's us declare concepts for template constraints
#include <limits>
#include <Eigen/Dense>

typedef double float_type;

typedef Eigen::Matrix<float_type, Eigen::Dynamic, Eigen::Dynamic> Mat2D;
typedef Eigen::Matrix<float_type, Eigen::Dynamic, 1>  Col;
typedef Eigen::Matrix<float_type, 1, Eigen::Dynamic>  Row;

template <typename T>
concept NumericType = std::integral<T> or std::floating_point<T>;

namespace FLOW {

    // number of streams around the splitter: one measured inlet, two unmeasured outlets
    constexpr size_t NFLOW = 3;

    // (x1, x2, x3), mass flow in t/h
    typedef Eigen::Matrix<float_type, NFLOW, 1> FlowVector;

    // log(0) stand-in; anything outside the box gets this, and exp() of it is exactly 0
    constexpr float_type LOG_ZERO = std::numeric_limits<float_type>::lowest();

}

#endif // FLOWPOST_TYPEDEFS_H
