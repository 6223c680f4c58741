// OpenCV-backed image and video outputs.

#include "MediaWriters.hpp"

#include <opencv2/imgcodecs.hpp>

#include <stdexcept>

OpenCvVideoSink::OpenCvVideoSink(const std::string& path,
                                 int fourcc,
                                 double fps,
                                 const cv::Size& size)
{
    if (!writer_.open(path, fourcc, fps, size))
    {
        throw std::runtime_error("Failed to open video writer: " + path);
    }
}

OpenCvVideoSink::~OpenCvVideoSink()
{
    release();
}

void OpenCvVideoSink::write(const cv::Mat& frame)
{
    writer_.write(frame);
}

void OpenCvVideoSink::release()
{
    if (writer_.isOpened())
    {
        writer_.release();
    }
}

std::unique_ptr<VideoSink> openVideoFile(const std::string& path,
                                         int fourcc,
                                         double fps,
                                         const cv::Size& size)
{
    return std::make_unique<OpenCvVideoSink>(path, fourcc, fps, size);
}

bool writeImageFile(const std::string& path, const cv::Mat& frame)
{
    return cv::imwrite(path, frame);
}

int fourccFromTag(const std::string& tag)
{
    if (tag.size() != 4)
    {
        throw std::invalid_argument("Codec tag must have four characters: " + tag);
    }
    return cv::VideoWriter::fourcc(tag[0], tag[1], tag[2], tag[3]);
}
