// Frame lifecycle, frame-rate estimation and lazy video writer creation.

#include "CaptureManager.hpp"

#include <opencv2/core.hpp>

#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace
{
    bool isUsableRate(double fps)
    {
        return std::isfinite(fps) && fps > 0.0;
    }
}

CaptureManager::CaptureManager(std::unique_ptr<FrameSource> source,
                               PreviewSink* preview,
                               bool mirrorPreview,
                               RecordingSettings settings)
    : source_(std::move(source)),
      preview_(preview),
      mirrorPreview_(mirrorPreview),
      settings_(std::move(settings)),
      imageWriter_(writeImageFile),
      videoSinkFactory_(openVideoFile),
      clock_([] { return Clock::now(); })
{
    if (!source_)
    {
        throw std::invalid_argument("CaptureManager requires a frame source.");
    }
}

CaptureManager::~CaptureManager()
{
    stopWritingVideo();
}

void CaptureManager::setImageWriter(ImageWriter writer)
{
    imageWriter_ = std::move(writer);
}

void CaptureManager::setVideoSinkFactory(VideoSinkFactory factory)
{
    videoSinkFactory_ = std::move(factory);
}

void CaptureManager::setClock(ClockSource clock)
{
    clock_ = std::move(clock);
}

void CaptureManager::setChannel(int channel)
{
    if (channel_ != channel)
    {
        channel_ = channel;
        frame_.release();
    }
}

void CaptureManager::enterFrame()
{
    CV_Assert(!enteredFrame_ && "previous enterFrame() had no matching exitFrame()");
    enteredFrame_ = source_->grab();
}

cv::Mat& CaptureManager::frame()
{
    if (enteredFrame_ && frame_.empty())
    {
        if (!source_->retrieve(frame_, channel_))
        {
            frame_.release();
        }
    }
    return frame_;
}

void CaptureManager::exitFrame()
{
    if (frame().empty())
    {
        enteredFrame_ = false;
        return;
    }

    updateFpsEstimate();

    if (preview_ != nullptr)
    {
        if (mirrorPreview_)
        {
            cv::Mat mirrored;
            cv::flip(frame_, mirrored, 1);
            preview_->show(mirrored);
        }
        else
        {
            preview_->show(frame_);
        }
    }

    if (imageFilename_)
    {
        const std::string path = std::move(*imageFilename_);
        imageFilename_.reset();
        if (!imageWriter_(path, frame_))
        {
            frame_.release();
            enteredFrame_ = false;
            throw std::runtime_error("Failed to write image: " + path);
        }
    }

    try
    {
        writeVideoFrame();
    }
    catch (const std::exception&)
    {
        // A writer that cannot be opened ends the recording session.
        frame_.release();
        enteredFrame_ = false;
        stopWritingVideo();
        throw;
    }

    frame_.release();
    enteredFrame_ = false;
}

void CaptureManager::writeImage(const std::string& filename)
{
    imageFilename_ = filename;
}

void CaptureManager::startWritingVideo(const std::string& filename, std::optional<int> fourcc)
{
    videoFilename_ = filename;
    videoFourcc_ = fourcc ? *fourcc : fourccFromTag(settings_.fourcc);
}

void CaptureManager::stopWritingVideo()
{
    videoFilename_.reset();
    videoFourcc_ = 0;
    if (videoWriter_)
    {
        videoWriter_->release();
        videoWriter_.reset();
    }
    videoWriterState_ = VideoWriterState::Unopened;
}

void CaptureManager::updateFpsEstimate()
{
    const Clock::time_point now = clock_();
    if (framesElapsed_ == 0)
    {
        startTime_ = now;
    }
    else
    {
        const std::chrono::duration<double> elapsed = now - startTime_;
        if (elapsed.count() > 0.0)
        {
            fpsEstimate_ = framesElapsed_ / elapsed.count();
        }
    }
    ++framesElapsed_;
}

std::optional<double> CaptureManager::resolveVideoFps() const
{
    const double reported = source_->frameRate();
    if (isUsableRate(reported))
    {
        return reported;
    }

    // Too few frames for a trustworthy estimate yet.
    if (framesElapsed_ < settings_.minFramesForEstimate)
    {
        return std::nullopt;
    }

    return fpsEstimate_.value_or(settings_.fallbackFps);
}

void CaptureManager::writeVideoFrame()
{
    if (!isWritingVideo())
    {
        return;
    }

    if (videoWriterState_ == VideoWriterState::Unopened)
    {
        const std::optional<double> fps = resolveVideoFps();
        if (!fps)
        {
            return;
        }

        cv::Size size(source_->frameWidth(), source_->frameHeight());
        if (size.width <= 0 || size.height <= 0)
        {
            size = frame_.size();
        }

        videoWriter_ = videoSinkFactory_(*videoFilename_, videoFourcc_, *fps, size);
        if (!videoWriter_)
        {
            throw std::runtime_error("Failed to open video writer: " + *videoFilename_);
        }
        videoWriterState_ = VideoWriterState::Opened;

        const char* rateSource = isUsableRate(source_->frameRate()) ? "device"
                               : fpsEstimate_ ? "estimate"
                               : "fallback";
        std::cout << "Recording " << *videoFilename_ << " at " << *fps << " fps (" << rateSource
                  << "), " << size.width << "x" << size.height << std::endl;
    }

    videoWriter_->write(frame_);
}
