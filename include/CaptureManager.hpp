// Owns the per-frame lifecycle: grabbing a frame from the capture source,
// forwarding it to the preview, and writing screenshots and video.

#pragma once

#include "FrameSource.hpp"
#include "MediaWriters.hpp"
#include "Types.hpp"
#include "WindowManager.hpp"

#include <opencv2/core.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

enum class VideoWriterState
{
    Unopened = 0,
    Opened
};

class CaptureManager
{
public:
    using Clock = std::chrono::steady_clock;
    using ClockSource = std::function<Clock::time_point()>;

    // preview may be null. It must outlive the manager.
    CaptureManager(std::unique_ptr<FrameSource> source,
                   PreviewSink* preview = nullptr,
                   bool mirrorPreview = false,
                   RecordingSettings settings = {});
    ~CaptureManager();

    CaptureManager(const CaptureManager&) = delete;
    CaptureManager& operator=(const CaptureManager&) = delete;

    void setImageWriter(ImageWriter writer);
    void setVideoSinkFactory(VideoSinkFactory factory);
    void setClock(ClockSource clock);

    [[nodiscard]] int channel() const { return channel_; }
    // Selecting another channel drops the frame cached for this cycle.
    void setChannel(int channel);

    // Starts a frame cycle. Calling it again before exitFrame() is a
    // programming error.
    void enterFrame();

    // The frame of the current cycle, decoded on first access. Empty when
    // no frame is available. Filters may modify it in place.
    cv::Mat& frame();

    // Publishes the frame (preview, pending screenshot, video) and ends
    // the cycle. Does nothing beyond ending the cycle when no frame exists.
    void exitFrame();

    // The screenshot is taken on the next exitFrame().
    void writeImage(const std::string& filename);

    // The writer is opened lazily once the frame rate is known.
    void startWritingVideo(const std::string& filename,
                           std::optional<int> fourcc = std::nullopt);
    void stopWritingVideo();

    [[nodiscard]] bool isWritingImage() const { return imageFilename_.has_value(); }
    [[nodiscard]] bool isWritingVideo() const { return videoFilename_.has_value(); }
    [[nodiscard]] bool isFrameEntered() const { return enteredFrame_; }

    [[nodiscard]] VideoWriterState videoWriterState() const { return videoWriterState_; }

    [[nodiscard]] int framesElapsed() const { return framesElapsed_; }
    [[nodiscard]] std::optional<double> fpsEstimate() const { return fpsEstimate_; }

private:
    void updateFpsEstimate();
    void writeVideoFrame();
    std::optional<double> resolveVideoFps() const;

    std::unique_ptr<FrameSource> source_;
    PreviewSink* preview_ = nullptr;
    bool mirrorPreview_ = false;
    RecordingSettings settings_;

    ImageWriter imageWriter_;
    VideoSinkFactory videoSinkFactory_;
    ClockSource clock_;

    int channel_ = 0;
    bool enteredFrame_ = false;
    cv::Mat frame_;

    std::optional<std::string> imageFilename_;
    std::optional<std::string> videoFilename_;
    int videoFourcc_ = 0;

    VideoWriterState videoWriterState_ = VideoWriterState::Unopened;
    std::unique_ptr<VideoSink> videoWriter_;

    Clock::time_point startTime_;
    int framesElapsed_ = 0;
    std::optional<double> fpsEstimate_;
};
