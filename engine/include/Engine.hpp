#pragma once

#include "Capabilities.hpp"
#include "Config.hpp"
#include "Surface.hpp"
#include <map>
#include <set>

namespace Plume
{

// GLFW host: owns the window and its context, drives frame callbacks once per refresh and
// turns mouse input into InputEvents in framebuffer pixels.
class Engine : public Surface
{
public:
    explicit Engine(WindowConfig config);
    ~Engine() override;

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    void initialize();
    void run();
    void shutdown();

    // Polls events, runs the due frame callbacks and presents.
    void renderFrame();

    // Runs the callbacks requested before this call. Callbacks requested from inside run on
    // the next dispatch.
    void dispatchFrame(double nowMs);

    void dispatchInput(const InputEvent& event);

    GLFWwindow* getWindow()
    {
        return m_context.window;
    }
    size_t pendingFrameCount() const
    {
        return m_frameCallbacks.size();
    }
    size_t listenerCount() const
    {
        return m_inputListeners.size();
    }

    void getDrawableSize(int& width, int& height) const override;
    const RenderContext& getContext() const override
    {
        return m_context;
    }
    void makeContextCurrent() override;

    FrameRequestId requestFrame(FrameCallback callback) override;
    void cancelFrame(FrameRequestId id) override;

    ListenerId addInputListener(InputListener listener) override;
    void removeInputListener(ListenerId id) override;

private:
    void toFramebufferCoords_(double windowX, double windowY, float& x, float& y) const;

    static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void cursorPosCallback(GLFWwindow* window, double x, double y);
    static void mouseButtonCallback(GLFWwindow* window, int button, int action, int mods);
    static void errorCallback(int error, const char* description);

    WindowConfig m_config;
    RenderContext m_context;
    bool m_glfwInitialized{false};

    std::map<FrameRequestId, FrameCallback> m_frameCallbacks;
    std::set<FrameRequestId> m_cancelledDuringDispatch;
    bool m_dispatching{false};
    FrameRequestId m_nextFrameId{1};

    std::map<ListenerId, InputListener> m_inputListeners;
    ListenerId m_nextListenerId{1};
};

}
