// Copyright (c) 2025.
// This header declares shared data structures and enumerations for the
// real-time webcam filter viewer.

#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

// A control point maps an input intensity to an output intensity.
using ControlPoint = cv::Point2d;

// Control points ordered by strictly increasing input value.
using Curve = std::vector<ControlPoint>;

// Enumeration describing how a filter transforms a frame.
enum class FilterKind
{
    Identity = 0,
    Curve,
    Kernel,
    Function
};

// Parameters of the edge-stroke filter.
struct StrokeParams
{
    int blurKsize = 7;   // Median blur aperture; values below 3 skip the blur.
    int edgeKsize = 5;   // Laplacian aperture.
};

// Controls how the capture manager opens its video writer.
struct RecordingSettings
{
    // Frames to observe before a running estimate replaces a missing device rate.
    int minFramesForEstimate = 20;
    double fallbackFps = 30.0;
    std::string fourcc = "XVID";   // Four-character codec tag used when none is given.
};

// Compile-time defaults for the whole application.
struct AppConfig
{
    int cameraIndex = 0;
    std::string windowTitle = "Cameo";
    bool mirrorPreview = true;

    std::string screenshotFilename = "screenshot.png";
    std::string screencastFilename = "screencast.avi";

    StrokeParams stroke;
    RecordingSettings recording;
};

// Values drawn by the preview overlay.
struct OverlayStatus
{
    std::string filterName;
    bool recording = false;
    std::optional<double> fpsEstimate;
};
