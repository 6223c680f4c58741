// GLFW window, OpenGL frame upload and Dear ImGui overlay.

#include "GlfwWindowManager.hpp"

#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

#include <opencv2/imgproc.hpp>

#include <array>
#include <stdexcept>
#include <utility>

namespace
{
    constexpr int kInitialWidth = 1280;
    constexpr int kInitialHeight = 720;

    constexpr const char* kGlVersion = "#version 330";

    // Matches a one millisecond key poll.
    constexpr double kEventWaitSeconds = 0.001;

    const char* const kVertexShaderPath = "shaders/textured_quad.vert";
    const char* const kFragmentShaderPath = "shaders/pass_through.frag";

    cv::Mat convertBgrToRgba(const cv::Mat& frameBgr)
    {
        cv::Mat rgba;
        cv::cvtColor(frameBgr, rgba, cv::COLOR_BGR2RGBA);
        // OpenCV rows start at the top, OpenGL textures at the bottom.
        cv::flip(rgba, rgba, 0);
        return rgba;
    }

    // Maps GLFW key tokens onto the ASCII-style codes the key handler expects.
    int translateKey(int key)
    {
        switch (key)
        {
            case GLFW_KEY_SPACE: return ' ';
            case GLFW_KEY_TAB: return '\t';
            case GLFW_KEY_ESCAPE: return 27;
            case GLFW_KEY_ENTER: return '\r';
            case GLFW_KEY_BACKSPACE: return '\b';
            default: break;
        }

        if (key >= GLFW_KEY_A && key <= GLFW_KEY_Z)
        {
            return 'a' + (key - GLFW_KEY_A);
        }
        return key;
    }
}

GlfwWindowManager* GlfwWindowManager::instance_ = nullptr;

GlfwWindowManager::GlfwWindowManager(std::string title)
    : title_(std::move(title))
{
    if (instance_ != nullptr)
    {
        throw std::runtime_error("Only one preview window is permitted.");
    }
    instance_ = this;
}

GlfwWindowManager::~GlfwWindowManager()
{
    destroyWindow();
    instance_ = nullptr;
}

void GlfwWindowManager::createWindow()
{
    if (window_ != nullptr)
    {
        return;
    }

    initialiseWindow();
    initialiseOpenGL();
    initialiseImGui();
    loadShaders();
    createQuad();
}

void GlfwWindowManager::destroyWindow()
{
    if (imguiInitialised_)
    {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        imguiInitialised_ = false;
    }

    if (window_ == nullptr)
    {
        return;
    }

    quadProgram_.release();
    if (texture_ != 0)
    {
        glDeleteTextures(1, &texture_);
        texture_ = 0;
    }
    if (ebo_ != 0)
    {
        glDeleteBuffers(1, &ebo_);
        ebo_ = 0;
    }
    if (vbo_ != 0)
    {
        glDeleteBuffers(1, &vbo_);
        vbo_ = 0;
    }
    if (vao_ != 0)
    {
        glDeleteVertexArrays(1, &vao_);
        vao_ = 0;
    }
    textureSize_ = cv::Size();

    glfwDestroyWindow(window_);
    glfwTerminate();
    window_ = nullptr;
}

void GlfwWindowManager::show(const cv::Mat& frame)
{
    if (window_ == nullptr || frame.empty())
    {
        return;
    }

    uploadFrameToTexture(frame);

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
    renderOverlay();
    ImGui::Render();

    glClearColor(0.05f, 0.05f, 0.05f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    renderFrame();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

    glfwSwapBuffers(window_);
}

void GlfwWindowManager::processEvents()
{
    if (window_ == nullptr)
    {
        return;
    }

    glfwWaitEventsTimeout(kEventWaitSeconds);

    while (!pendingKeys_.empty())
    {
        const int keycode = pendingKeys_.front();
        pendingKeys_.pop_front();
        notifyKeypress(keycode);
    }

    // The callback may already have closed the window.
    if (window_ != nullptr && glfwWindowShouldClose(window_))
    {
        destroyWindow();
    }
}

void GlfwWindowManager::setOverlay(const OverlayStatus& status)
{
    overlay_ = status;
}

void GlfwWindowManager::initialiseWindow()
{
    if (glfwInit() == GLFW_FALSE)
    {
        throw std::runtime_error("Failed to initialise GLFW.");
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif

    window_ = glfwCreateWindow(kInitialWidth, kInitialHeight, title_.c_str(), nullptr, nullptr);
    if (!window_)
    {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window.");
    }

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(0);

    // Installed before ImGui so its backend chains to these.
    glfwSetKeyCallback(window_, keyCallback);
    glfwSetFramebufferSizeCallback(window_, framebufferSizeCallback);
}

void GlfwWindowManager::initialiseOpenGL()
{
    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress)))
    {
        throw std::runtime_error("Failed to initialise GLAD.");
    }
}

void GlfwWindowManager::initialiseImGui()
{
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window_, true);
    ImGui_ImplOpenGL3_Init(kGlVersion);
    imguiInitialised_ = true;
}

void GlfwWindowManager::loadShaders()
{
    quadProgram_ = ShaderProgram::fromFiles(kVertexShaderPath, kFragmentShaderPath);
}

void GlfwWindowManager::createQuad()
{
    const std::array<float, 16> vertices = {
        // positions      // tex coords
        -1.0f, -1.0f,     0.0f, 0.0f,
         1.0f, -1.0f,     1.0f, 0.0f,
         1.0f,  1.0f,     1.0f, 1.0f,
        -1.0f,  1.0f,     0.0f, 1.0f,
    };

    const std::array<unsigned int, 6> indices = { 0, 1, 2, 2, 3, 0 };

    glGenVertexArrays(1, &vao_);
    glGenBuffers(1, &vbo_);
    glGenBuffers(1, &ebo_);

    glBindVertexArray(vao_);
    glBindBuffer(GL_ARRAY_BUFFER, vbo_);
    glBufferData(GL_ARRAY_BUFFER, sizeof(vertices), vertices.data(), GL_STATIC_DRAW);

    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ebo_);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, sizeof(indices), indices.data(), GL_STATIC_DRAW);

    const GLsizei stride = 4 * sizeof(float);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, stride, reinterpret_cast<void*>(0));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, stride, reinterpret_cast<void*>(2 * sizeof(float)));

    glBindVertexArray(0);
}

void GlfwWindowManager::createTexture(int width, int height)
{
    if (texture_ == 0)
    {
        glGenTextures(1, &texture_);
    }
    glBindTexture(GL_TEXTURE_2D, texture_);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, width, height,
                 0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    glBindTexture(GL_TEXTURE_2D, 0);

    textureSize_ = cv::Size(width, height);
}

void GlfwWindowManager::uploadFrameToTexture(const cv::Mat& frameBgr)
{
    if (texture_ == 0 || textureSize_ != frameBgr.size())
    {
        createTexture(frameBgr.cols, frameBgr.rows);
    }

    cv::Mat rgba = convertBgrToRgba(frameBgr);

    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    glBindTexture(GL_TEXTURE_2D, texture_);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0,
                    rgba.cols, rgba.rows,
                    GL_RGBA, GL_UNSIGNED_BYTE, rgba.data);
    glBindTexture(GL_TEXTURE_2D, 0);
}

void GlfwWindowManager::renderFrame()
{
    if (texture_ == 0)
    {
        return;
    }

    quadProgram_.use();
    quadProgram_.bindSampler("uFrame", 0);

    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, texture_);

    glBindVertexArray(vao_);
    glDrawElements(GL_TRIANGLES, 6, GL_UNSIGNED_INT, nullptr);
    glBindVertexArray(0);
}

void GlfwWindowManager::renderOverlay()
{
    ImGui::SetNextWindowPos(ImVec2(10.0f, 10.0f), ImGuiCond_Always);
    ImGui::SetNextWindowBgAlpha(0.5f);
    ImGui::Begin("Status", nullptr,
                 ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                 ImGuiWindowFlags_NoInputs | ImGuiWindowFlags_NoSavedSettings);

    ImGui::Text("Filter: %s", overlay_.filterName.c_str());
    ImGui::Text("Recording: %s", overlay_.recording ? "yes" : "no");
    if (overlay_.fpsEstimate)
    {
        ImGui::Text("FPS: %.1f", *overlay_.fpsEstimate);
    }
    else
    {
        ImGui::TextUnformatted("FPS: --");
    }
    ImGui::Separator();
    ImGui::TextUnformatted("SPACE screenshot | TAB record | f filter | q quit");

    ImGui::End();
}

void GlfwWindowManager::keyCallback(GLFWwindow* /*window*/, int key, int /*scancode*/, int action, int /*mods*/)
{
    if (instance_ == nullptr || action != GLFW_PRESS || key == GLFW_KEY_UNKNOWN)
    {
        return;
    }
    instance_->pendingKeys_.push_back(translateKey(key));
}

void GlfwWindowManager::framebufferSizeCallback(GLFWwindow* /*window*/, int width, int height)
{
    glViewport(0, 0, width, height);
}
