#include "Application.hpp"
#include "Fakes.hpp"
#include "Filter.hpp"

#include <gtest/gtest.h>

#include <opencv2/core.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    struct AppHarness
    {
        explicit AppHarness(std::vector<Filter> filters = Filters::defaultCycle())
        {
            auto fakeWindow = std::make_unique<FakeWindow>();
            window = fakeWindow.get();

            auto fakeSource = std::make_unique<FakeFrameSource>(solidFrame(8, 6, cv::Scalar(10, 20, 30)), 30.0);
            source = fakeSource.get();

            auto manager = std::make_unique<CaptureManager>(std::move(fakeSource), window, false);
            manager->setImageWriter([this](const std::string& path, const cv::Mat&)
            {
                writtenImages.push_back(path);
                return true;
            });
            manager->setVideoSinkFactory(videos.factory());

            app = std::make_unique<Application>(config, std::move(fakeWindow), std::move(manager),
                                                std::move(filters));
        }

        AppConfig config;
        FakeVideoFactory videos;
        std::vector<std::string> writtenImages;

        FakeWindow* window = nullptr;
        FakeFrameSource* source = nullptr;
        std::unique_ptr<Application> app;
    };

    Filter invertFilter()
    {
        return Filters::valueFunction("invert", [](double x) { return 255.0 - x; });
    }
}

TEST(Application, NextFilterKeyCyclesThroughDefaultFilters)
{
    AppHarness h;
    EXPECT_EQ(h.app->filters().current().name(), "none");

    h.app->onKeypress('f');
    EXPECT_EQ(h.app->filters().current().name(), "stroke");

    for (int i = 1; i < 9; ++i)
    {
        h.app->onKeypress('f');
    }
    EXPECT_EQ(h.app->filters().current().name(), "none");
}

TEST(Application, SpaceRequestsScreenshot)
{
    AppHarness h;
    h.app->onKeypress(32);

    EXPECT_TRUE(h.app->capture().isWritingImage());

    h.window->script = { {}, {'q'} };
    h.app->run();

    ASSERT_EQ(h.writtenImages.size(), 1u);
    EXPECT_EQ(h.writtenImages[0], "screenshot.png");
}

TEST(Application, TabTogglesRecording)
{
    AppHarness h;

    h.app->onKeypress(9);
    EXPECT_TRUE(h.app->capture().isWritingVideo());

    h.window->script = { {}, {}, {'q'} };
    h.app->run();

    h.app->onKeypress(9);
    EXPECT_FALSE(h.app->capture().isWritingVideo());

    ASSERT_EQ(h.videos.sinks.size(), 1u);
    EXPECT_EQ(h.videos.sinks[0]->path, "screencast.avi");
    EXPECT_EQ(h.videos.sinks[0]->writes, 3);
    EXPECT_EQ(h.videos.sinks[0]->releases, 1);
}

TEST(Application, QuitKeyEndsRun)
{
    AppHarness h;
    h.window->script = { {}, {'q'}, {'f'} };

    h.app->run();

    EXPECT_EQ(h.window->createCount, 1);
    EXPECT_FALSE(h.window->isWindowCreated());
    EXPECT_EQ(h.window->eventPolls, 2);
    EXPECT_EQ(h.window->shown.size(), 2u);
    EXPECT_EQ(h.app->filters().current().name(), "none");
}

TEST(Application, EscapeAlsoQuits)
{
    AppHarness h;
    h.window->script = { {27} };

    h.app->run();

    EXPECT_FALSE(h.window->isWindowCreated());
    EXPECT_EQ(h.window->shown.size(), 1u);
}

TEST(Application, KeyCodesAreMaskedToLowByte)
{
    AppHarness h;
    h.window->script = { {0x100 | 'f'}, {0x100 | 'q'} };

    h.app->run();

    EXPECT_EQ(h.app->filters().current().name(), "stroke");
    EXPECT_FALSE(h.window->isWindowCreated());
}

TEST(Application, UnknownKeysAreIgnored)
{
    AppHarness h;
    h.app->onKeypress('x');
    h.app->onKeypress(13);

    EXPECT_EQ(h.app->filters().current().name(), "none");
    EXPECT_FALSE(h.app->capture().isWritingImage());
    EXPECT_FALSE(h.app->capture().isWritingVideo());
}

TEST(Application, PreviewShowsFilteredFrame)
{
    AppHarness h({ invertFilter() });
    h.window->script = { {'q'} };

    h.app->run();

    ASSERT_EQ(h.window->shown.size(), 1u);
    EXPECT_EQ(h.window->shown[0].at<cv::Vec3b>(0, 0), cv::Vec3b(245, 235, 225));
}

TEST(Application, OverlayReportsFilterAndRecording)
{
    AppHarness h({ Filters::none(), invertFilter() });
    h.app->onKeypress('f');
    h.app->onKeypress(9);
    h.window->script = { {'q'} };

    h.app->run();

    EXPECT_EQ(h.window->overlay.filterName, "invert");
    EXPECT_TRUE(h.window->overlay.recording);
}

TEST(Application, MissingFrameSkipsFilterAndPreview)
{
    AppHarness h;
    h.source->retrieveSucceeds = false;
    h.window->script = { {}, {'q'} };

    h.app->run();

    EXPECT_TRUE(h.window->shown.empty());
    EXPECT_TRUE(h.window->overlay.filterName.empty());
    EXPECT_EQ(h.app->capture().framesElapsed(), 0);
}

TEST(Application, RequiresWindowAndCapture)
{
    auto source = std::make_unique<FakeFrameSource>(solidFrame(2, 2, cv::Scalar::all(0)));
    auto capture = std::make_unique<CaptureManager>(std::move(source));

    EXPECT_THROW(Application(AppConfig{}, nullptr, std::move(capture), Filters::defaultCycle()),
                 std::invalid_argument);
    EXPECT_THROW(Application(AppConfig{}, std::make_unique<FakeWindow>(), nullptr, Filters::defaultCycle()),
                 std::invalid_argument);
}

TEST(Application, RequiresAtLeastOneFilter)
{
    auto source = std::make_unique<FakeFrameSource>(solidFrame(2, 2, cv::Scalar::all(0)));
    auto capture = std::make_unique<CaptureManager>(std::move(source));

    EXPECT_THROW(Application(AppConfig{}, std::make_unique<FakeWindow>(), std::move(capture), {}),
                 std::invalid_argument);
}
