// Declares the CPU-side pixel transforms built on top of OpenCV. Every
// routine reads src and writes dst, which may be the same Mat.

#pragma once

#include "Types.hpp"

#include <opencv2/core.hpp>

#include <array>

namespace FrameProcessor
{
    // Darkens pixels on detected edges. The source is median blurred first
    // when blurKsize >= 3, then a Laplacian of the intensity builds an
    // inverse alpha mask (255 - edge) / 255 that scales every channel.
    void strokeEdges(const cv::Mat& src, cv::Mat& dst,
                     int blurKsize = 7, int edgeKsize = 5);

    // Blue and green averaged into a new blue channel: (b', b', r).
    void recolorRC(const cv::Mat& src, cv::Mat& dst);

    // Blue replaced by min(b, g, r).
    void recolorRGV(const cv::Mat& src, cv::Mat& dst);

    // Blue replaced by max(b, g, r).
    void recolorCMV(const cv::Mat& src, cv::Mat& dst);

    // Same-size convolution with an odd-sized kernel.
    void convolve(const cv::Mat& src, cv::Mat& dst, const cv::Mat& kernel);

    // Runs every channel of a BGR frame through its own table. Empty tables
    // leave their channel as it was in src.
    void applyChannelTables(const cv::Mat& src, cv::Mat& dst,
                            const std::array<cv::Mat, 3>& tables);
}
