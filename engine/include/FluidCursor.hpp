#pragma once

#include "Capabilities.hpp"
#include "Config.hpp"
#include "PointerInput.hpp"
#include "Surface.hpp"
#include <filesystem>
#include <functional>
#include <memory>

namespace Plume
{

class Compositor;
class FluidSolver;
class FullscreenQuad;
class RenderTargetPool;
class ShaderLibrary;

enum class FluidState
{
    Uninitialized,
    Running,
    TornDown
};

// One interactive fluid session on a surface. Owns every GPU resource, the input queue and
// the frame loop; nothing lives outside the instance.
class FluidCursor : public std::enable_shared_from_this<FluidCursor>
{
public:
    // Compiles programs and allocates fields. The surface context must be usable.
    FluidCursor(Surface& surface, const FluidConfig& config, const Capabilities& capabilities,
                const std::filesystem::path& shaderDir, ColorPalette palette = ColorPalette());
    ~FluidCursor();

    FluidCursor(const FluidCursor&) = delete;
    FluidCursor& operator=(const FluidCursor&) = delete;

    // Subscribes to input and schedules the first frame. Requires shared ownership.
    void start();

    // Cancels the pending frame, unsubscribes and releases GPU resources. Idempotent.
    void stop();

    // One frame loop iteration at the given timestamp (milliseconds). No-op unless Running.
    void tick(double nowMs);

    // Runs a frame with an explicit timestep, clamped to [0, kMaxDeltaTime]. No-op unless
    // Running, so frames cannot reach the fields before start() or after stop().
    void updateFrame(float dt);

    void enqueueInput(const InputEvent& event);

    FluidState getState() const
    {
        return m_state;
    }
    const FluidConfig& getConfig() const
    {
        return m_config;
    }
    const FluidSolver& getSolver() const
    {
        return *m_solver;
    }
    FluidSolver& getSolver()
    {
        return *m_solver;
    }
    const RenderTargetPool& getPool() const
    {
        return *m_pool;
    }
    const InputAdapter& getInput() const
    {
        return m_input;
    }

private:
    void onFrame_(double nowMs);
    void renderFrame_(float dt);
    void finishFrame_();
    void scheduleFrame_();
    bool resizeIfNeeded_();
    void applyInputs_();
    void releaseResources_();

    Surface& m_surface;
    FluidConfig m_config;
    Capabilities m_capabilities;

    std::unique_ptr<FullscreenQuad> m_quad;
    std::unique_ptr<ShaderLibrary> m_shaders;
    std::unique_ptr<RenderTargetPool> m_pool;
    std::unique_ptr<FluidSolver> m_solver;
    std::unique_ptr<Compositor> m_compositor;
    InputAdapter m_input;

    FluidState m_state{FluidState::Uninitialized};
    FrameRequestId m_frameRequest{0};
    ListenerId m_inputListener{0};
    bool m_hasFrameRequest{false};
    bool m_hasInputListener{false};

    double m_lastUpdateTime{0.0};
    bool m_hasLastUpdateTime{false};
    int m_allocatedWidth{0};
    int m_allocatedHeight{0};

    bool m_inFrame{false};
    bool m_releasePending{false};
};

using StopFunction = std::function<void()>;

// Opens a fluid session on the surface. Never throws for an unusable environment: without a
// context or renderable float formats the returned function is an inert no-op. The returned
// function tears the session down and is safe to call repeatedly.
StopFunction start(Surface& surface, const FluidConfig& config);
StopFunction start(Surface& surface, const FluidConfig& config,
                   const std::filesystem::path& shaderDir);

}
