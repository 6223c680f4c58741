// Entry point: opens the default camera and runs the filter viewer.

#include "Application.hpp"
#include "CaptureManager.hpp"
#include "Filter.hpp"
#include "FrameSource.hpp"
#include "GlfwWindowManager.hpp"
#include "Types.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <utility>

int main()
{
    try
    {
        const AppConfig config{};

        auto window = std::make_unique<GlfwWindowManager>(config.windowTitle);
        auto capture = std::make_unique<CaptureManager>(
            std::make_unique<CameraSource>(config.cameraIndex),
            window.get(),
            config.mirrorPreview,
            config.recording);

        Application app(config,
                        std::move(window),
                        std::move(capture),
                        Filters::defaultCycle(config.stroke));
        app.run();
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
