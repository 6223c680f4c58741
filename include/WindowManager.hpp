// Declares the display collaborators: a sink for preview frames and the
// window that owns it and delivers key presses.

#pragma once

#include "Types.hpp"

#include <opencv2/core.hpp>

#include <functional>
#include <utility>

class PreviewSink
{
public:
    virtual ~PreviewSink() = default;

    virtual void show(const cv::Mat& frame) = 0;
};

class WindowManager : public PreviewSink
{
public:
    // Receives the low 8 bits of each pressed key code.
    using KeypressCallback = std::function<void(int keycode)>;

    virtual void createWindow() = 0;
    virtual void destroyWindow() = 0;
    [[nodiscard]] virtual bool isWindowCreated() const = 0;

    // Polls pending input and forwards key presses to the callback.
    virtual void processEvents() = 0;

    virtual void setOverlay(const OverlayStatus& /*status*/) {}

    void setKeypressCallback(KeypressCallback callback)
    {
        keypressCallback_ = std::move(callback);
    }

protected:
    void notifyKeypress(int keycode) const
    {
        if (keypressCallback_)
        {
            keypressCallback_(keycode & 0xFF);
        }
    }

private:
    KeypressCallback keypressCallback_;
};
