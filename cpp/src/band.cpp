#include "riskband/band.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "riskband/common.hpp"
#include "riskband/errors.hpp"

namespace riskband {

Band make_band(double threshold, double band_width) {
    check_unit_interval(threshold, "threshold");
    if (!std::isfinite(band_width) || band_width < 0.0) {
        throw InvalidInput("band_width must be finite and >= 0, got " + format_double(band_width));
    }

    Band band{std::max(0.0, threshold - band_width), std::min(1.0, threshold + band_width)};
    if (band.t1 > band.t2) {
        throw std::logic_error("band invariant violated: t1 " + format_double(band.t1) + " > t2 " +
                               format_double(band.t2));
    }
    return band;
}

}  // namespace riskband
