// Declares the curve interpolation and lookup-table helpers used to build
// per-intensity colour transforms.

#pragma once

#include "Types.hpp"

#include <opencv2/core.hpp>

#include <functional>

// Maps an input intensity to an output intensity. An empty function means
// "no transform".
using CurveFunction = std::function<double(double)>;

namespace LookupTable
{
    constexpr int kDefaultLength = 256;

    // Builds an interpolating function through the control points. Fewer
    // than two points yield an empty function. Four or more points use a
    // not-a-knot cubic spline, otherwise piecewise linear. Inputs outside
    // the control-point range are extrapolated from the end segments.
    CurveFunction buildCurveFunction(const Curve& points);

    // Evaluates func at every integer in [0, length), clamps to
    // [0, length - 1] and stores the result as a 1 x length CV_8U row.
    // Returns an empty Mat when func is empty.
    cv::Mat buildLookupTable(const CurveFunction& func,
                             int length = kDefaultLength);

    // Returns x -> f(g(x)). When one side is empty the other is returned.
    CurveFunction composeFunctions(const CurveFunction& f,
                                   const CurveFunction& g);

    // dst[i] = table[src[i]] for every element. An empty table leaves dst
    // untouched. src and dst may be the same Mat.
    void applyLookupTable(const cv::Mat& table,
                          const cv::Mat& src,
                          cv::Mat& dst);
}
