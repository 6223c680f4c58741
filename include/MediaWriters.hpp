// Declares the image and video outputs used to persist captured frames.

#pragma once

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include <functional>
#include <memory>
#include <string>

// Sequential frame output. release() flushes and closes; it is safe to call
// more than once.
class VideoSink
{
public:
    virtual ~VideoSink() = default;

    virtual void write(const cv::Mat& frame) = 0;
    virtual void release() = 0;
};

class OpenCvVideoSink : public VideoSink
{
public:
    OpenCvVideoSink(const std::string& path, int fourcc, double fps, const cv::Size& size);
    ~OpenCvVideoSink() override;

    OpenCvVideoSink(const OpenCvVideoSink&) = delete;
    OpenCvVideoSink& operator=(const OpenCvVideoSink&) = delete;

    void write(const cv::Mat& frame) override;
    void release() override;

private:
    cv::VideoWriter writer_;
};

using VideoSinkFactory = std::function<std::unique_ptr<VideoSink>(
    const std::string& path, int fourcc, double fps, const cv::Size& size)>;

// Writes one frame to path. Returns false when the encoder fails.
using ImageWriter = std::function<bool(const std::string& path, const cv::Mat& frame)>;

std::unique_ptr<VideoSink> openVideoFile(const std::string& path,
                                         int fourcc,
                                         double fps,
                                         const cv::Size& size);

bool writeImageFile(const std::string& path, const cv::Mat& frame);

// Packs a four-character tag such as "XVID" into an OpenCV fourcc code.
int fourccFromTag(const std::string& tag);
