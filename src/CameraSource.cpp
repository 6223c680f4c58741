// Camera capture backed by cv::VideoCapture.

#include "FrameSource.hpp"

#include <stdexcept>
#include <string>

CameraSource::CameraSource(int deviceIndex)
{
    if (!camera_.open(deviceIndex))
    {
        throw std::runtime_error("Unable to open camera " + std::to_string(deviceIndex) + ".");
    }
}

bool CameraSource::grab()
{
    return camera_.isOpened() && camera_.grab();
}

bool CameraSource::retrieve(cv::Mat& frame, int channel)
{
    if (!camera_.retrieve(frame, channel))
    {
        return false;
    }
    return !frame.empty();
}

double CameraSource::frameRate() const
{
    return camera_.get(cv::CAP_PROP_FPS);
}

int CameraSource::frameWidth() const
{
    return static_cast<int>(camera_.get(cv::CAP_PROP_FRAME_WIDTH));
}

int CameraSource::frameHeight() const
{
    return static_cast<int>(camera_.get(cv::CAP_PROP_FRAME_HEIGHT));
}
