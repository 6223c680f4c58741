// Implements curve interpolation and lookup-table construction on top of OpenCV.

#include "LookupTable.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace
{
    // Piecewise cubic through the control points, stored as the second
    // derivative at every knot. All-zero second derivatives give the
    // piecewise linear interpolant.
    class PiecewiseCurve
    {
    public:
        PiecewiseCurve(const Curve& points, bool cubic)
        {
            xs_.reserve(points.size());
            ys_.reserve(points.size());
            for (const auto& point : points)
            {
                xs_.push_back(point.x);
                ys_.push_back(point.y);
            }
            secondDerivatives_.assign(points.size(), 0.0);

            if (cubic)
            {
                solveNotAKnot();
            }
        }

        double operator()(double x) const
        {
            const std::size_t n = xs_.size();
            if (x == xs_.back())
            {
                return ys_.back();
            }

            // Values beyond either end reuse the outermost segment.
            const auto upper = std::upper_bound(xs_.begin(), xs_.end(), x);
            std::size_t segment = 0;
            if (upper != xs_.begin())
            {
                segment = std::min<std::size_t>(
                    static_cast<std::size_t>(upper - xs_.begin()) - 1, n - 2);
            }

            const double h = xs_[segment + 1] - xs_[segment];
            const double t = x - xs_[segment];
            const double m0 = secondDerivatives_[segment];
            const double m1 = secondDerivatives_[segment + 1];
            const double slope = (ys_[segment + 1] - ys_[segment]) / h;
            const double b = slope - h * (2.0 * m0 + m1) / 6.0;

            return ys_[segment] + t * (b + t * (m0 / 2.0 + t * (m1 - m0) / (6.0 * h)));
        }

    private:
        void solveNotAKnot()
        {
            const int n = static_cast<int>(xs_.size());

            std::vector<double> h(n - 1);
            std::vector<double> slope(n - 1);
            for (int i = 0; i < n - 1; ++i)
            {
                h[i] = xs_[i + 1] - xs_[i];
                slope[i] = (ys_[i + 1] - ys_[i]) / h[i];
            }

            cv::Mat A = cv::Mat::zeros(n, n, CV_64F);
            cv::Mat rhs = cv::Mat::zeros(n, 1, CV_64F);

            // Third derivative continuous across the second knot.
            A.at<double>(0, 0) = h[1];
            A.at<double>(0, 1) = -(h[0] + h[1]);
            A.at<double>(0, 2) = h[0];

            for (int i = 1; i < n - 1; ++i)
            {
                A.at<double>(i, i - 1) = h[i - 1];
                A.at<double>(i, i) = 2.0 * (h[i - 1] + h[i]);
                A.at<double>(i, i + 1) = h[i];
                rhs.at<double>(i, 0) = 6.0 * (slope[i] - slope[i - 1]);
            }

            // ... and across the second to last knot.
            A.at<double>(n - 1, n - 3) = h[n - 2];
            A.at<double>(n - 1, n - 2) = -(h[n - 3] + h[n - 2]);
            A.at<double>(n - 1, n - 1) = h[n - 3];

            cv::Mat solution;
            const bool solved = cv::solve(A, rhs, solution, cv::DECOMP_LU);
            CV_Assert(solved);

            for (int i = 0; i < n; ++i)
            {
                secondDerivatives_[i] = solution.at<double>(i, 0);
            }
        }

        std::vector<double> xs_;
        std::vector<double> ys_;
        std::vector<double> secondDerivatives_;
    };
}

namespace LookupTable
{
    CurveFunction buildCurveFunction(const Curve& points)
    {
        if (points.size() < 2)
        {
            return {};
        }

        for (std::size_t i = 1; i < points.size(); ++i)
        {
            CV_Assert(points[i].x > points[i - 1].x);
        }

        const bool cubic = points.size() >= 4;
        return PiecewiseCurve(points, cubic);
    }

    cv::Mat buildLookupTable(const CurveFunction& func, int length)
    {
        if (!func)
        {
            return cv::Mat();
        }

        CV_Assert(length > 0 && length <= kDefaultLength);

        const double maxValue = static_cast<double>(length - 1);
        cv::Mat table(1, length, CV_8U);
        for (int i = 0; i < length; ++i)
        {
            const double value = std::clamp(func(static_cast<double>(i)), 0.0, maxValue);
            // Truncate, matching an unsigned 8-bit cast of the clamped value.
            table.at<uchar>(0, i) = static_cast<uchar>(value);
        }
        return table;
    }

    CurveFunction composeFunctions(const CurveFunction& f, const CurveFunction& g)
    {
        if (!f)
        {
            return g;
        }
        if (!g)
        {
            return f;
        }
        return [f, g](double x) { return f(g(x)); };
    }

    void applyLookupTable(const cv::Mat& table, const cv::Mat& src, cv::Mat& dst)
    {
        if (table.empty())
        {
            return;
        }

        CV_Assert(table.total() == static_cast<std::size_t>(kDefaultLength));
        CV_Assert(src.depth() == CV_8U);
        cv::LUT(src, table, dst);
    }
}
