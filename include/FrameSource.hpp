// Declares the capture source consumed by the capture manager and its
// OpenCV camera implementation.

#pragma once

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

class FrameSource
{
public:
    virtual ~FrameSource() = default;

    // Advances to the next frame without decoding it.
    virtual bool grab() = 0;

    // Decodes the grabbed frame. Returns false when no frame is available.
    virtual bool retrieve(cv::Mat& frame, int channel) = 0;

    // Reported properties; 0 or NaN when the device does not know them.
    virtual double frameRate() const = 0;
    virtual int frameWidth() const = 0;
    virtual int frameHeight() const = 0;
};

class CameraSource : public FrameSource
{
public:
    explicit CameraSource(int deviceIndex);

    bool grab() override;
    bool retrieve(cv::Mat& frame, int channel) override;

    double frameRate() const override;
    int frameWidth() const override;
    int frameHeight() const override;

private:
    // cv::VideoCapture::get is not const.
    mutable cv::VideoCapture camera_;
};
