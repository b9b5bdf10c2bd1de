#include "Engine.hpp"
#include "Profiling.hpp"
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

void Plume::Engine::errorCallback(int error, const char* description)
{
    std::cerr << "GLFW Error " << error << ": " << description << std::endl;
}

void Plume::Engine::keyCallback(GLFWwindow* window, int key, int /*scancode*/, int action,
                                int /*mods*/)
{
    if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS)
    {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
    }
}

void Plume::Engine::cursorPosCallback(GLFWwindow* window, double x, double y)
{
    Engine* engine = static_cast<Engine*>(glfwGetWindowUserPointer(window));

    InputEvent event;
    event.type = InputEvent::Type::PointerMove;
    engine->toFramebufferCoords_(x, y, event.x, event.y);
    engine->dispatchInput(event);
}

void Plume::Engine::mouseButtonCallback(GLFWwindow* window, int /*button*/, int action,
                                        int /*mods*/)
{
    if (action != GLFW_PRESS)
    {
        return;
    }

    Engine* engine = static_cast<Engine*>(glfwGetWindowUserPointer(window));

    double x = 0.0;
    double y = 0.0;
    glfwGetCursorPos(window, &x, &y);

    InputEvent event;
    event.type = InputEvent::Type::PointerDown;
    engine->toFramebufferCoords_(x, y, event.x, event.y);
    engine->dispatchInput(event);
}

namespace Plume
{

Engine::Engine(WindowConfig config) : m_config(std::move(config)) {}

Engine::~Engine()
{
    shutdown();
}

void Engine::initialize()
{
    glfwSetErrorCallback(errorCallback);

    if (!glfwInit())
    {
        throw std::runtime_error("Failed to initialize GLFW");
    }
    m_glfwInitialized = true;

    m_context = createWindowWithBestContext(m_config);
    if (!m_context.isValid())
    {
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwSetWindowUserPointer(m_context.window, this);
    glfwSetKeyCallback(m_context.window, keyCallback);
    glfwSetCursorPosCallback(m_context.window, cursorPosCallback);
    glfwSetMouseButtonCallback(m_context.window, mouseButtonCallback);

    glfwSwapInterval(m_config.vsync ? 1 : 0);

    int width = 0;
    int height = 0;
    getDrawableSize(width, height);
    std::cout << "Engine: window " << m_config.width << "x" << m_config.height
              << ", framebuffer " << width << "x" << height << std::endl;
}

void Engine::run()
{
    while (!glfwWindowShouldClose(m_context.window))
    {
        renderFrame();
    }
}

void Engine::renderFrame()
{
    glfwPollEvents();

    dispatchFrame(glfwGetTime() * 1000.0);

    glfwSwapBuffers(m_context.window);

    PLUME_PROFILE_FRAME_MARK();
}

void Engine::dispatchFrame(double nowMs)
{
    std::map<FrameRequestId, FrameCallback> due;
    due.swap(m_frameCallbacks);

    m_dispatching = true;
    m_cancelledDuringDispatch.clear();

    for (auto& [id, callback] : due)
    {
        if (m_cancelledDuringDispatch.count(id) != 0)
        {
            continue;
        }
        callback(nowMs);
    }

    m_dispatching = false;
    m_cancelledDuringDispatch.clear();
}

void Engine::dispatchInput(const InputEvent& event)
{
    // Listeners may unsubscribe while being notified
    const auto listeners = m_inputListeners;
    for (const auto& [id, listener] : listeners)
    {
        listener(event);
    }
}

void Engine::shutdown()
{
    // Pending callbacks may own sessions that still need the context to release their textures
    {
        auto frames = std::move(m_frameCallbacks);
        m_frameCallbacks.clear();
        frames.clear();

        auto listeners = std::move(m_inputListeners);
        m_inputListeners.clear();
    }

    if (m_context.window)
    {
        glfwDestroyWindow(m_context.window);
        m_context = RenderContext{};
    }

    if (m_glfwInitialized)
    {
        glfwTerminate();
        m_glfwInitialized = false;
    }
}

void Engine::getDrawableSize(int& width, int& height) const
{
    width = 0;
    height = 0;
    if (m_context.window)
    {
        glfwGetFramebufferSize(m_context.window, &width, &height);
    }
}

void Engine::makeContextCurrent()
{
    if (m_context.window)
    {
        glfwMakeContextCurrent(m_context.window);
    }
}

FrameRequestId Engine::requestFrame(FrameCallback callback)
{
    const FrameRequestId id = m_nextFrameId++;
    m_frameCallbacks.emplace(id, std::move(callback));
    return id;
}

void Engine::cancelFrame(FrameRequestId id)
{
    m_frameCallbacks.erase(id);
    if (m_dispatching)
    {
        m_cancelledDuringDispatch.insert(id);
    }
}

ListenerId Engine::addInputListener(InputListener listener)
{
    const ListenerId id = m_nextListenerId++;
    m_inputListeners.emplace(id, std::move(listener));
    return id;
}

void Engine::removeInputListener(ListenerId id)
{
    m_inputListeners.erase(id);
}

void Engine::toFramebufferCoords_(double windowX, double windowY, float& x, float& y) const
{
    int windowWidth = 0;
    int windowHeight = 0;
    glfwGetWindowSize(m_context.window, &windowWidth, &windowHeight);

    int fbWidth = 0;
    int fbHeight = 0;
    glfwGetFramebufferSize(m_context.window, &fbWidth, &fbHeight);

    const double scaleX = windowWidth > 0 ? static_cast<double>(fbWidth) / windowWidth : 1.0;
    const double scaleY = windowHeight > 0 ? static_cast<double>(fbHeight) / windowHeight : 1.0;

    x = static_cast<float>(std::floor(windowX * scaleX));
    y = static_cast<float>(std::floor(windowY * scaleY));
}

}
