#ifndef RISKBAND_BAND_HPP
#define RISKBAND_BAND_HPP

namespace riskband {

// Review band around an operating threshold: 0 <= t1 <= threshold <= t2 <= 1.
struct Band {
    double t1 = 0.0;
    double t2 = 0.0;

    double width() const { return t2 - t1; }
};

Band make_band(double threshold, double band_width = 0.05);

}  // namespace riskband

#endif  // RISKBAND_BAND_HPP
