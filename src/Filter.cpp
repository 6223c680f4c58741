// Implements filter dispatch and the preset factories.

#include "Filter.hpp"
#include "FrameProcessor.hpp"

#include <utility>

namespace
{
    cv::Mat kernel3x3(float k00, float k01, float k02,
                      float k10, float k11, float k12,
                      float k20, float k21, float k22)
    {
        return (cv::Mat_<float>(3, 3) << k00, k01, k02,
                                         k10, k11, k12,
                                         k20, k21, k22);
    }
}

Filter::Filter(std::string name, FilterKind kind)
    : name_(std::move(name)), kind_(kind)
{
}

Filter Filter::identity(std::string name)
{
    return Filter(std::move(name), FilterKind::Identity);
}

Filter Filter::curve(std::string name,
                     cv::Mat valueTable,
                     std::array<cv::Mat, 3> channelTables)
{
    Filter filter(std::move(name), FilterKind::Curve);
    filter.valueTable_ = std::move(valueTable);
    filter.channelTables_ = std::move(channelTables);
    return filter;
}

Filter Filter::kernel(std::string name, cv::Mat kernel)
{
    CV_Assert(!kernel.empty());
    CV_Assert(kernel.rows % 2 == 1 && kernel.cols % 2 == 1);

    Filter filter(std::move(name), FilterKind::Kernel);
    kernel.convertTo(filter.kernel_, CV_32F);
    return filter;
}

Filter Filter::function(std::string name, Function function)
{
    CV_Assert(static_cast<bool>(function));

    Filter filter(std::move(name), FilterKind::Function);
    filter.function_ = std::move(function);
    return filter;
}

void Filter::apply(const cv::Mat& src, cv::Mat& dst) const
{
    switch (kind_)
    {
        case FilterKind::Curve:
        {
            if (src.data != dst.data)
            {
                src.copyTo(dst);
            }
            LookupTable::applyLookupTable(valueTable_, dst, dst);

            const bool anyChannel = !channelTables_[0].empty() ||
                                    !channelTables_[1].empty() ||
                                    !channelTables_[2].empty();
            if (anyChannel)
            {
                FrameProcessor::applyChannelTables(dst, dst, channelTables_);
            }
            break;
        }

        case FilterKind::Kernel:
            FrameProcessor::convolve(src, dst, kernel_);
            break;

        case FilterKind::Function:
            function_(src, dst);
            break;

        case FilterKind::Identity:
        default:
            if (src.data != dst.data)
            {
                src.copyTo(dst);
            }
            break;
    }
}

namespace Filters
{
    Filter none()
    {
        return Filter::identity("none");
    }

    Filter valueFunction(std::string name, const CurveFunction& valueFunc)
    {
        return Filter::curve(std::move(name),
                             LookupTable::buildLookupTable(valueFunc),
                             {});
    }

    Filter valueCurve(std::string name, const Curve& valuePoints)
    {
        return valueFunction(std::move(name),
                             LookupTable::buildCurveFunction(valuePoints));
    }

    Filter channelFunctions(std::string name,
                            const CurveFunction& valueFunc,
                            const CurveFunction& blueFunc,
                            const CurveFunction& greenFunc,
                            const CurveFunction& redFunc)
    {
        using LookupTable::buildLookupTable;
        using LookupTable::composeFunctions;

        return Filter::curve(std::move(name), cv::Mat(), {
            buildLookupTable(composeFunctions(blueFunc, valueFunc)),
            buildLookupTable(composeFunctions(greenFunc, valueFunc)),
            buildLookupTable(composeFunctions(redFunc, valueFunc))
        });
    }

    Filter channelCurves(std::string name,
                         const Curve& valuePoints,
                         const Curve& bluePoints,
                         const Curve& greenPoints,
                         const Curve& redPoints)
    {
        using LookupTable::buildCurveFunction;

        return channelFunctions(std::move(name),
                                buildCurveFunction(valuePoints),
                                buildCurveFunction(bluePoints),
                                buildCurveFunction(greenPoints),
                                buildCurveFunction(redPoints));
    }

    // Warm, soft tones.
    Filter portra()
    {
        return channelCurves("portra",
                             { {0, 0}, {23, 20}, {157, 173}, {255, 255} },
                             { {0, 0}, {41, 46}, {231, 228}, {255, 255} },
                             { {0, 0}, {52, 47}, {189, 196}, {255, 255} },
                             { {0, 0}, {69, 69}, {213, 218}, {255, 255} });
    }

    // Vibrant, natural colour.
    Filter provia()
    {
        return channelCurves("provia",
                             {},
                             { {0, 0}, {35, 25}, {205, 227}, {255, 255} },
                             { {0, 0}, {27, 21}, {196, 207}, {255, 255} },
                             { {0, 0}, {59, 54}, {202, 210}, {255, 255} });
    }

    // High contrast, saturated.
    Filter velvia()
    {
        return channelCurves("velvia",
                             { {0, 0}, {128, 118}, {221, 215}, {255, 255} },
                             { {0, 0}, {25, 21}, {122, 153}, {165, 206}, {255, 255} },
                             { {0, 0}, {25, 21}, {95, 102}, {181, 208}, {255, 255} },
                             { {0, 0}, {41, 28}, {183, 209}, {255, 255} });
    }

    Filter crossProcess()
    {
        return channelCurves("cross",
                             {},
                             { {0, 20}, {255, 235} },
                             { {0, 0}, {56, 39}, {208, 226}, {255, 255} },
                             { {0, 0}, {56, 22}, {211, 255}, {255, 255} });
    }

    Filter strokeEdges(const StrokeParams& params)
    {
        return Filter::function("stroke", [params](const cv::Mat& src, cv::Mat& dst)
        {
            FrameProcessor::strokeEdges(src, dst, params.blurKsize, params.edgeKsize);
        });
    }

    Filter sharpen()
    {
        return Filter::kernel("sharpen", kernel3x3(-1, -1, -1,
                                                   -1,  9, -1,
                                                   -1, -1, -1));
    }

    Filter findEdges()
    {
        return Filter::kernel("edges", kernel3x3(-1, -1, -1,
                                                 -1,  8, -1,
                                                 -1, -1, -1));
    }

    Filter blur()
    {
        return Filter::kernel("blur", cv::Mat(5, 5, CV_32F, cv::Scalar(1.0 / 25.0)));
    }

    Filter emboss()
    {
        return Filter::kernel("emboss", kernel3x3(-2, -1, 0,
                                                  -1,  1, 1,
                                                   0,  1, 2));
    }

    Filter recolorRC()
    {
        return Filter::function("rc", FrameProcessor::recolorRC);
    }

    Filter recolorRGV()
    {
        return Filter::function("rgv", FrameProcessor::recolorRGV);
    }

    Filter recolorCMV()
    {
        return Filter::function("cmv", FrameProcessor::recolorCMV);
    }

    std::vector<Filter> defaultCycle(const StrokeParams& stroke)
    {
        return {
            none(),
            strokeEdges(stroke),
            portra(),
            provia(),
            velvia(),
            crossProcess(),
            sharpen(),
            blur(),
            emboss()
        };
    }

    std::vector<Filter> catalog(const StrokeParams& stroke)
    {
        std::vector<Filter> filters = defaultCycle(stroke);
        filters.push_back(findEdges());
        filters.push_back(recolorRC());
        filters.push_back(recolorRGV());
        filters.push_back(recolorCMV());
        return filters;
    }
}
