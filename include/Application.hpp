// Ties capture, filtering, preview and key handling together.

#pragma once

#include "CaptureManager.hpp"
#include "Filter.hpp"
#include "FilterSelector.hpp"
#include "Types.hpp"
#include "WindowManager.hpp"

#include <memory>
#include <vector>

class Application
{
public:
    // The capture manager previews into window, so window is declared first
    // below and outlives it.
    Application(AppConfig config,
                std::unique_ptr<WindowManager> window,
                std::unique_ptr<CaptureManager> capture,
                std::vector<Filter> filters);

    // Runs until the window is closed.
    void run();

    void onKeypress(int keycode);

    [[nodiscard]] const FilterSelector& filters() const { return filters_; }
    [[nodiscard]] CaptureManager& capture() { return *capture_; }

private:
    void processFrame();
    void toggleRecording();
    void selectNextFilter();
    void updateOverlay();

    AppConfig config_;
    std::unique_ptr<WindowManager> window_;
    std::unique_ptr<CaptureManager> capture_;
    FilterSelector filters_;
};
