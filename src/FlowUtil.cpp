#include <FlowPost/FlowUtil.h>
#include <FlowPost/Grid.h>
#include <FlowPost/Errors.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

using std::cerr;
using std::endl;
using std::vector;

namespace FLOW {

    std::string slurp(const std::string & filename) {
        std::ifstream ifs(filename.c_str(), std::ios::in);
        if (not ifs) { throw ConfigError("cannot open " + filename); }
        std::stringstream sstr;
        sstr << ifs.rdbuf();
        return sstr.str();
    }

    float_type median(const Col & data) {
        return quantile(data, 0.5);
    }

    float_type quantile(const Col & data, const float_type q) {
        if (data.size() == 0) { throw std::invalid_argument("quantile of an empty sample"); }
        if (not ((0.0 <= q) and (q <= 1.0))) { throw std::invalid_argument("quantile must be in [0, 1]"); }
        // copy & sort data
        vector<float_type> vdata(data.data(), data.data() + data.size());
        std::sort(vdata.begin(), vdata.end());

        const float_type h = q * (vdata.size() - 1);
        const size_t lo = static_cast<size_t>(std::floor(h));
        const size_t hi = std::min(lo + 1, vdata.size() - 1);
        return vdata[lo] + (h - lo) * (vdata[hi] - vdata[lo]);
    }

    float_type variance(const Col & data, const float_type _mean) {
        if (data.size() < 2) {
            cerr << "WARNING: Variance called with " << data.size() << " data values. Returning 0." << endl;
            return 0;
        } else {
            return (data.array() - _mean).square().sum() / (data.size() - 1);
        }
    }

    float_type trapezoid(const Col & y, const Col & x) {
        if (y.size() != x.size()) { throw std::invalid_argument("trapezoid: abscissae and ordinates differ in length"); }
        return trapezoid_weights(x).dot(y);
    }

    float_type trapezoid(const Mat2D & z, const Col & x, const Col & y) {
        if (z.rows() != x.size() or z.cols() != y.size()) { throw std::invalid_argument("trapezoid: grid and values differ in shape"); }
        return trapezoid_weights(x).dot(z * trapezoid_weights(y));
    }

    Col histogram_density(const Col & samples, const Col & coords) {
        const Eigen::Index n = coords.size();
        if (n < 2) { throw std::invalid_argument("histogram needs at least 2 coordinates"); }
        const float_type lo = coords[0], hi = coords[n - 1];
        const float_type h = (hi - lo) / (n - 1);

        Col counts = Col::Zero(n);
        size_t used = 0;
        for (Eigen::Index i = 0; i < samples.size(); ++i) {
            const float_type v = samples[i];
            if (v < lo or v > hi) { continue; }
            const Eigen::Index k = std::min<Eigen::Index>(static_cast<Eigen::Index>(std::lround((v - lo) / h)), n - 1);
            counts[k] += 1.0;
            ++used;
        }
        if (used == 0) { return counts; }

        Col widths = Col::Constant(n, h);
        widths[0] = widths[n - 1] = h / 2.0;
        return counts.cwiseQuotient(widths) / static_cast<float_type>(used);
    }

    float_type total_variation(const Col & p, const Col & q, const Col & coords) {
        if (p.size() != q.size()) { throw std::invalid_argument("total_variation: densities differ in length"); }
        return 0.5 * trapezoid((p - q).cwiseAbs(), coords);
    }

}
