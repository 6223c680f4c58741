#include "FrameProcessor.hpp"

#include <gtest/gtest.h>

#include <opencv2/core.hpp>

namespace
{
    cv::Mat stepImage(int size, uchar left, uchar right)
    {
        cv::Mat image(size, size, CV_8UC3, cv::Scalar::all(left));
        image(cv::Rect(size / 2, 0, size - size / 2, size)).setTo(cv::Scalar::all(right));
        return image;
    }

    bool identical(const cv::Mat& a, const cv::Mat& b)
    {
        return a.size() == b.size() && a.type() == b.type() &&
               cv::norm(a, b, cv::NORM_INF) == 0.0;
    }
}

TEST(FrameProcessor, StrokeEdgesLeavesUniformImageUnchanged)
{
    const cv::Mat src(50, 50, CV_8UC3, cv::Scalar(40, 120, 220));
    cv::Mat dst;

    FrameProcessor::strokeEdges(src, dst);

    EXPECT_TRUE(identical(src, dst));
}

TEST(FrameProcessor, StrokeEdgesWithoutBlurLeavesUniformImageUnchanged)
{
    cv::Mat image(30, 30, CV_8UC3, cv::Scalar(90, 90, 90));
    const cv::Mat before = image.clone();

    FrameProcessor::strokeEdges(image, image, 1, 3);

    EXPECT_TRUE(identical(before, image));
}

TEST(FrameProcessor, StrokeEdgesDarkensAlongEdgesOnly)
{
    const cv::Mat src = stepImage(40, 50, 200);
    cv::Mat dst;

    FrameProcessor::strokeEdges(src, dst);

    ASSERT_EQ(dst.size(), src.size());
    ASSERT_EQ(dst.type(), src.type());

    // Far from the step nothing changes.
    EXPECT_EQ(dst.at<cv::Vec3b>(20, 2), src.at<cv::Vec3b>(20, 2));
    EXPECT_EQ(dst.at<cv::Vec3b>(20, 37), src.at<cv::Vec3b>(20, 37));

    // Nothing gets brighter, and something near the step gets darker.
    cv::Mat brighter;
    cv::compare(dst, src, brighter, cv::CMP_GT);
    EXPECT_EQ(cv::countNonZero(brighter.reshape(1)), 0);

    cv::Mat darker;
    cv::compare(dst, src, darker, cv::CMP_LT);
    EXPECT_GT(cv::countNonZero(darker.reshape(1)), 0);
}

TEST(FrameProcessor, StrokeEdgesTruncatesScaledChannels)
{
    // A single darker pixel gives a Laplacian of 4 at its centre and
    // saturates to 0 around it.
    cv::Mat image(9, 9, CV_8UC3, cv::Scalar::all(200));
    image.at<cv::Vec3b>(4, 4) = cv::Vec3b(199, 199, 199);

    FrameProcessor::strokeEdges(image, image, 1, 1);

    // 199 * 251 / 255 = 195.88
    EXPECT_EQ(image.at<cv::Vec3b>(4, 4), cv::Vec3b(195, 195, 195));
    EXPECT_EQ(image.at<cv::Vec3b>(4, 5), cv::Vec3b(200, 200, 200));
    EXPECT_EQ(image.at<cv::Vec3b>(0, 0), cv::Vec3b(200, 200, 200));
}

TEST(FrameProcessor, RecolorRCAveragesBlueAndGreen)
{
    cv::Mat image(2, 2, CV_8UC3, cv::Scalar(10, 30, 200));

    FrameProcessor::recolorRC(image, image);

    EXPECT_EQ(image.at<cv::Vec3b>(1, 1), cv::Vec3b(20, 20, 200));
}

TEST(FrameProcessor, RecolorRGVTakesMinimumIntoBlue)
{
    const cv::Mat src(2, 2, CV_8UC3, cv::Scalar(60, 30, 200));
    cv::Mat dst;

    FrameProcessor::recolorRGV(src, dst);

    EXPECT_EQ(dst.at<cv::Vec3b>(0, 0), cv::Vec3b(30, 30, 200));
    EXPECT_EQ(src.at<cv::Vec3b>(0, 0), cv::Vec3b(60, 30, 200));
}

TEST(FrameProcessor, RecolorCMVTakesMaximumIntoBlue)
{
    const cv::Mat src(2, 2, CV_8UC3, cv::Scalar(60, 30, 200));
    cv::Mat dst;

    FrameProcessor::recolorCMV(src, dst);

    EXPECT_EQ(dst.at<cv::Vec3b>(0, 1), cv::Vec3b(200, 30, 200));
}

TEST(FrameProcessor, ConvolveRejectsEvenKernel)
{
    const cv::Mat src(8, 8, CV_8UC3, cv::Scalar::all(0));
    cv::Mat dst;

    EXPECT_THROW(FrameProcessor::convolve(src, dst, cv::Mat::ones(2, 2, CV_32F)), cv::Exception);
}

TEST(FrameProcessor, ConvolveInPlaceMatchesSeparateOutput)
{
    cv::Mat src(16, 16, CV_8UC3);
    cv::randu(src, cv::Scalar::all(0), cv::Scalar::all(255));
    const cv::Mat kernel = (cv::Mat_<float>(3, 3) << 0, -1, 0, -1, 5, -1, 0, -1, 0);

    cv::Mat separate;
    FrameProcessor::convolve(src, separate, kernel);

    cv::Mat inPlace = src.clone();
    FrameProcessor::convolve(inPlace, inPlace, kernel);

    EXPECT_TRUE(identical(separate, inPlace));
}

TEST(FrameProcessor, ChannelTablesSkipMissingChannels)
{
    cv::Mat invert(1, 256, CV_8U);
    for (int i = 0; i < 256; ++i)
    {
        invert.at<uchar>(0, i) = static_cast<uchar>(255 - i);
    }

    const cv::Mat src(3, 3, CV_8UC3, cv::Scalar(10, 20, 30));
    cv::Mat dst;
    FrameProcessor::applyChannelTables(src, dst, { cv::Mat(), invert, cv::Mat() });

    EXPECT_EQ(dst.at<cv::Vec3b>(2, 2), cv::Vec3b(10, 235, 30));
}

TEST(FrameProcessor, RejectsNonBgrInput)
{
    const cv::Mat gray(4, 4, CV_8UC1, cv::Scalar(5));
    cv::Mat dst;

    EXPECT_THROW(FrameProcessor::recolorRC(gray, dst), cv::Exception);
    EXPECT_THROW(FrameProcessor::strokeEdges(gray, dst), cv::Exception);
}
