// In-memory stand-ins for the camera, preview window, writers and clock.

#pragma once

#include "CaptureManager.hpp"
#include "FrameSource.hpp"
#include "MediaWriters.hpp"
#include "WindowManager.hpp"

#include <opencv2/core.hpp>

#include <chrono>
#include <deque>
#include <utility>
#include <memory>
#include <string>
#include <vector>

inline cv::Mat solidFrame(int width, int height, const cv::Scalar& bgr)
{
    return cv::Mat(height, width, CV_8UC3, bgr);
}

class FakeFrameSource : public FrameSource
{
public:
    explicit FakeFrameSource(cv::Mat frame, double rate = 0.0)
        : frame_(std::move(frame)), rate_(rate)
    {
    }

    bool grab() override
    {
        ++grabCount;
        return grabSucceeds;
    }

    bool retrieve(cv::Mat& frame, int channel) override
    {
        ++retrieveCount;
        lastChannel = channel;
        if (!retrieveSucceeds)
        {
            return false;
        }
        frame = frame_.clone();
        return true;
    }

    double frameRate() const override { return rate_; }
    int frameWidth() const override { return reportedWidth; }
    int frameHeight() const override { return reportedHeight; }

    bool grabSucceeds = true;
    bool retrieveSucceeds = true;
    int reportedWidth = 0;
    int reportedHeight = 0;

    int grabCount = 0;
    int retrieveCount = 0;
    int lastChannel = -1;

private:
    cv::Mat frame_;
    double rate_;
};

struct RecordedSink
{
    std::string path;
    int fourcc = 0;
    double fps = 0.0;
    cv::Size size;
    int framesAtOpen = 0;
    int writes = 0;
    int releases = 0;
};

class FakeVideoSink : public VideoSink
{
public:
    explicit FakeVideoSink(RecordedSink& record) : record_(record) {}

    void write(const cv::Mat& /*frame*/) override { ++record_.writes; }
    void release() override { ++record_.releases; }

private:
    RecordedSink& record_;
};

// Collects every writer the capture manager asks for.
class FakeVideoFactory
{
public:
    explicit FakeVideoFactory(const CaptureManager* capture = nullptr)
        : capture_(capture)
    {
    }

    VideoSinkFactory factory()
    {
        return [this](const std::string& path, int fourcc, double fps, const cv::Size& size)
        {
            RecordedSink record;
            record.path = path;
            record.fourcc = fourcc;
            record.fps = fps;
            record.size = size;
            record.framesAtOpen = capture_ != nullptr ? capture_->framesElapsed() : 0;
            sinks.push_back(std::make_unique<RecordedSink>(record));
            return std::make_unique<FakeVideoSink>(*sinks.back());
        };
    }

    void watch(const CaptureManager* capture) { capture_ = capture; }

    std::vector<std::unique_ptr<RecordedSink>> sinks;

private:
    const CaptureManager* capture_;
};

// Advances by a fixed step every time it is read.
class SteppingClock
{
public:
    explicit SteppingClock(std::chrono::milliseconds step) : step_(step) {}

    CaptureManager::ClockSource source()
    {
        return [this]
        {
            const auto value = now_;
            now_ += step_;
            return value;
        };
    }

private:
    CaptureManager::Clock::time_point now_{};
    std::chrono::milliseconds step_;
};

class FakePreview : public PreviewSink
{
public:
    void show(const cv::Mat& frame) override { shown.push_back(frame.clone()); }

    std::vector<cv::Mat> shown;
};

// Scripted window: each processEvents() call delivers the next batch of keys.
class FakeWindow : public WindowManager
{
public:
    void createWindow() override { created_ = true; ++createCount; }
    void destroyWindow() override { created_ = false; }
    [[nodiscard]] bool isWindowCreated() const override { return created_; }

    void show(const cv::Mat& frame) override { shown.push_back(frame.clone()); }

    void processEvents() override
    {
        ++eventPolls;
        if (script.empty())
        {
            return;
        }
        const std::vector<int> keys = script.front();
        script.pop_front();
        for (const int key : keys)
        {
            notifyKeypress(key);
        }
    }

    void setOverlay(const OverlayStatus& status) override { overlay = status; }

    std::deque<std::vector<int>> script;
    std::vector<cv::Mat> shown;
    OverlayStatus overlay;
    int createCount = 0;
    int eventPolls = 0;

private:
    bool created_ = false;
};
