// Main loop and key-command dispatch.

#include "Application.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace
{
    constexpr int kKeySpace = 32;
    constexpr int kKeyTab = 9;
    constexpr int kKeyEscape = 27;
    constexpr int kKeyNextFilter = 'f';
    constexpr int kKeyQuit = 'q';
}

Application::Application(AppConfig config,
                         std::unique_ptr<WindowManager> window,
                         std::unique_ptr<CaptureManager> capture,
                         std::vector<Filter> filters)
    : config_(std::move(config)),
      window_(std::move(window)),
      capture_(std::move(capture)),
      filters_(std::move(filters))
{
    if (!window_ || !capture_)
    {
        throw std::invalid_argument("Application requires a window and a capture manager.");
    }

    window_->setKeypressCallback([this](int keycode) { onKeypress(keycode); });
}

void Application::run()
{
    window_->createWindow();
    std::cout << "Controls: SPACE=screenshot, TAB=start/stop video, f=next filter, q/Esc=quit" << std::endl;

    while (window_->isWindowCreated())
    {
        processFrame();
        window_->processEvents();
    }
}

void Application::processFrame()
{
    capture_->enterFrame();

    cv::Mat& frame = capture_->frame();
    if (!frame.empty())
    {
        filters_.current().apply(frame, frame);
        updateOverlay();
    }

    capture_->exitFrame();
}

void Application::onKeypress(int keycode)
{
    switch (keycode)
    {
        case kKeySpace:
            capture_->writeImage(config_.screenshotFilename);
            std::cout << "Screenshot requested: " << config_.screenshotFilename << std::endl;
            break;

        case kKeyTab:
            toggleRecording();
            break;

        case kKeyNextFilter:
            selectNextFilter();
            break;

        case kKeyQuit:
        case kKeyEscape:
            std::cout << "Closing window..." << std::endl;
            window_->destroyWindow();
            break;

        default:
            break;
    }
}

void Application::toggleRecording()
{
    if (!capture_->isWritingVideo())
    {
        capture_->startWritingVideo(config_.screencastFilename);
        std::cout << "Recording video: " << config_.screencastFilename << std::endl;
    }
    else
    {
        capture_->stopWritingVideo();
        std::cout << "Recording stopped" << std::endl;
    }
}

void Application::selectNextFilter()
{
    const Filter& filter = filters_.next();
    std::cout << "Current filter: " << filter.name() << std::endl;
}

void Application::updateOverlay()
{
    OverlayStatus status;
    status.filterName = filters_.current().name();
    status.recording = capture_->isWritingVideo();
    status.fpsEstimate = capture_->fpsEstimate();
    window_->setOverlay(status);
}
