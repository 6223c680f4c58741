// Declares the uniform filter value type and the preset factories.

#pragma once

#include "LookupTable.hpp"
#include "Types.hpp"

#include <opencv2/core.hpp>

#include <array>
#include <functional>
#include <string>
#include <vector>

// A named frame transform. The kind tag selects which of the immutable
// payloads (lookup tables, kernel or function) apply() uses.
class Filter
{
public:
    using Function = std::function<void(const cv::Mat& src, cv::Mat& dst)>;

    static Filter identity(std::string name);

    // valueTable is applied to every channel sample first; channelTables
    // (blue, green, red) then remap their own channel. Empty tables are
    // skipped.
    static Filter curve(std::string name,
                        cv::Mat valueTable,
                        std::array<cv::Mat, 3> channelTables);

    static Filter kernel(std::string name, cv::Mat kernel);

    static Filter function(std::string name, Function function);

    // Reads src and writes a frame of the same size into dst. dst may be
    // the same Mat as src.
    void apply(const cv::Mat& src, cv::Mat& dst) const;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] FilterKind kind() const { return kind_; }

    [[nodiscard]] const cv::Mat& valueTable() const { return valueTable_; }
    [[nodiscard]] const cv::Mat& channelTable(int channel) const { return channelTables_.at(channel); }
    [[nodiscard]] const cv::Mat& kernelMatrix() const { return kernel_; }

private:
    Filter(std::string name, FilterKind kind);

    std::string name_;
    FilterKind kind_ = FilterKind::Identity;

    cv::Mat valueTable_;
    std::array<cv::Mat, 3> channelTables_;
    cv::Mat kernel_;
    Function function_;
};

namespace Filters
{
    Filter none();

    // Single table built from one curve or function, applied to all channels.
    Filter valueCurve(std::string name, const Curve& valuePoints);
    Filter valueFunction(std::string name, const CurveFunction& valueFunc);

    // One table per channel, each the channel function composed over the
    // shared value function.
    Filter channelFunctions(std::string name,
                            const CurveFunction& valueFunc,
                            const CurveFunction& blueFunc,
                            const CurveFunction& greenFunc,
                            const CurveFunction& redFunc);
    Filter channelCurves(std::string name,
                         const Curve& valuePoints,
                         const Curve& bluePoints,
                         const Curve& greenPoints,
                         const Curve& redPoints);

    // Film emulations.
    Filter portra();
    Filter provia();
    Filter velvia();
    Filter crossProcess();

    Filter strokeEdges(const StrokeParams& params = {});

    Filter sharpen();
    Filter findEdges();
    Filter blur();
    Filter emboss();

    Filter recolorRC();
    Filter recolorRGV();
    Filter recolorCMV();

    // The list cycled by the application, starting with "none".
    std::vector<Filter> defaultCycle(const StrokeParams& stroke = {});

    // Every preset the library provides.
    std::vector<Filter> catalog(const StrokeParams& stroke = {});
}
