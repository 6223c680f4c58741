// Implements CPU-based pixel transforms using OpenCV.

#include "FrameProcessor.hpp"
#include "LookupTable.hpp"

#include <opencv2/imgproc.hpp>

#include <vector>

namespace
{
    std::vector<cv::Mat> splitBgr(const cv::Mat& src)
    {
        CV_Assert(src.type() == CV_8UC3);
        std::vector<cv::Mat> channels;
        cv::split(src, channels);
        return channels;
    }
}

namespace FrameProcessor
{
    void strokeEdges(const cv::Mat& src, cv::Mat& dst, int blurKsize, int edgeKsize)
    {
        CV_Assert(src.type() == CV_8UC3);

        cv::Mat gray;
        if (blurKsize >= 3)
        {
            cv::Mat blurred;
            cv::medianBlur(src, blurred, blurKsize);
            cv::cvtColor(blurred, gray, cv::COLOR_BGR2GRAY);
        }
        else
        {
            cv::cvtColor(src, gray, cv::COLOR_BGR2GRAY);
        }

        cv::Mat edges;
        cv::Laplacian(gray, edges, CV_8U, edgeKsize);

        // Each channel scales by (255 - edge) / 255, truncated.
        cv::Mat stroked = src.clone();
        stroked.forEach<cv::Vec3b>([&edges](cv::Vec3b& pixel, const int* position)
        {
            const int inverseAlpha = 255 - edges.at<uchar>(position[0], position[1]);
            for (int c = 0; c < 3; ++c)
            {
                pixel[c] = static_cast<uchar>(pixel[c] * inverseAlpha / 255);
            }
        });

        stroked.copyTo(dst);
    }

    void recolorRC(const cv::Mat& src, cv::Mat& dst)
    {
        std::vector<cv::Mat> channels = splitBgr(src);
        cv::Mat& b = channels[0];
        cv::addWeighted(b, 0.5, channels[1], 0.5, 0.0, b);
        cv::merge(std::vector<cv::Mat>{ b, b, channels[2] }, dst);
    }

    void recolorRGV(const cv::Mat& src, cv::Mat& dst)
    {
        std::vector<cv::Mat> channels = splitBgr(src);
        cv::min(channels[0], channels[1], channels[0]);
        cv::min(channels[0], channels[2], channels[0]);
        cv::merge(channels, dst);
    }

    void recolorCMV(const cv::Mat& src, cv::Mat& dst)
    {
        std::vector<cv::Mat> channels = splitBgr(src);
        cv::max(channels[0], channels[1], channels[0]);
        cv::max(channels[0], channels[2], channels[0]);
        cv::merge(channels, dst);
    }

    void convolve(const cv::Mat& src, cv::Mat& dst, const cv::Mat& kernel)
    {
        CV_Assert(!kernel.empty());
        CV_Assert(kernel.rows % 2 == 1 && kernel.cols % 2 == 1);

        // Filter into scratch so dst may alias src.
        cv::Mat filtered;
        cv::filter2D(src, filtered, -1, kernel);
        filtered.copyTo(dst);
    }

    void applyChannelTables(const cv::Mat& src, cv::Mat& dst,
                            const std::array<cv::Mat, 3>& tables)
    {
        std::vector<cv::Mat> channels = splitBgr(src);
        for (std::size_t c = 0; c < tables.size(); ++c)
        {
            LookupTable::applyLookupTable(tables[c], channels[c], channels[c]);
        }
        cv::merge(channels, dst);
    }
}
