#ifndef PATHGEOM_CURVES_LENGTHOPTIONS_H
#define PATHGEOM_CURVES_LENGTHOPTIONS_H

#include <boost/optional.hpp>

namespace pathGeom {

/// Settings for the polyline approximation behind QuadraticBezier::length and CubicBezier::length.
struct LengthOptions
{
    /// The T-step between consecutive samples, in [minStep,1]. If unset, each curve uses its own
    /// 'defaultLengthStep'.
    boost::optional< double > step;

    /// If false, 't' starts at 0 and is advanced by 'step' while it is below 1, sampling 't' and 't + step'
    /// each time; the samples near T=1 are wherever the floating-point accumulation puts them.
    /// If true, use exactly ceil(1/step) intervals and clamp the last sample to T=1.
    bool closeFinalInterval = false;

    static constexpr double minStep = 1e-6;
};

} // pathGeom

#endif // #include
