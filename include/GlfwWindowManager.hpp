// Preview window built on GLFW, OpenGL and Dear ImGui. Frames are uploaded
// to a texture drawn on a full-window quad with a status overlay on top.

#pragma once

#include "ShaderProgram.hpp"
#include "Types.hpp"
#include "WindowManager.hpp"

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <opencv2/core.hpp>

#include <deque>
#include <string>

class GlfwWindowManager : public WindowManager
{
public:
    explicit GlfwWindowManager(std::string title);
    ~GlfwWindowManager() override;

    GlfwWindowManager(const GlfwWindowManager&) = delete;
    GlfwWindowManager& operator=(const GlfwWindowManager&) = delete;

    void createWindow() override;
    void destroyWindow() override;
    [[nodiscard]] bool isWindowCreated() const override { return window_ != nullptr; }

    void show(const cv::Mat& frame) override;
    void processEvents() override;
    void setOverlay(const OverlayStatus& status) override;

private:
    void initialiseWindow();
    void initialiseOpenGL();
    void initialiseImGui();
    void loadShaders();
    void createQuad();
    void createTexture(int width, int height);
    void uploadFrameToTexture(const cv::Mat& frameBgr);
    void renderFrame();
    void renderOverlay();

    static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void framebufferSizeCallback(GLFWwindow* window, int width, int height);

private:
    std::string title_;
    GLFWwindow* window_ = nullptr;
    bool imguiInitialised_ = false;

    GLuint vao_ = 0;
    GLuint vbo_ = 0;
    GLuint ebo_ = 0;
    GLuint texture_ = 0;
    cv::Size textureSize_;

    ShaderProgram quadProgram_;
    OverlayStatus overlay_;

    std::deque<int> pendingKeys_;

    static GlfwWindowManager* instance_;
};
