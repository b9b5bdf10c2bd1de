#include "FluidCursor.hpp"
#include "Compositor.hpp"
#include "EngineConfig.hpp"
#include "FluidMath.hpp"
#include "FluidSolver.hpp"
#include "FullscreenQuad.hpp"
#include "Profiling.hpp"
#include "RenderTarget.hpp"
#include "ShaderProgram.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace Plume
{

FluidCursor::FluidCursor(Surface& surface, const FluidConfig& config,
                         const Capabilities& capabilities, const std::filesystem::path& shaderDir,
                         ColorPalette palette)
    : m_surface(surface), m_config(applyCapabilities(config, capabilities)),
      m_capabilities(capabilities), m_input(m_config.splatForce, std::move(palette))
{
    validateFluidConfig(m_config);

    m_surface.makeContextCurrent();

    m_quad = std::make_unique<FullscreenQuad>();
    m_quad->initialize();

    m_shaders = std::make_unique<ShaderLibrary>(shaderDir, m_surface.getContext().version.api,
                                                m_capabilities.supportLinearFiltering);
    m_pool = std::make_unique<RenderTargetPool>();
    m_solver =
        std::make_unique<FluidSolver>(m_config, m_capabilities, *m_shaders, *m_pool, *m_quad);
    m_compositor = std::make_unique<Compositor>(m_shaders->display(), *m_quad, m_config.shading,
                                                m_config.transparent);

    m_surface.getDrawableSize(m_allocatedWidth, m_allocatedHeight);
    m_solver->initFramebuffers(m_allocatedWidth, m_allocatedHeight);

    std::cout << "FluidCursor: sim " << m_solver->velocity().width() << "x"
              << m_solver->velocity().height() << ", dye " << m_solver->dye().width() << "x"
              << m_solver->dye().height() << std::endl;
}

FluidCursor::~FluidCursor()
{
    stop();
    if (m_releasePending)
    {
        releaseResources_();
    }
}

void FluidCursor::start()
{
    if (m_state != FluidState::Uninitialized)
    {
        return;
    }

    m_state = FluidState::Running;

    std::weak_ptr<FluidCursor> weak = weak_from_this();
    m_inputListener = m_surface.addInputListener([weak](const InputEvent& event) {
        if (auto self = weak.lock())
        {
            self->enqueueInput(event);
        }
    });
    m_hasInputListener = true;

    scheduleFrame_();
}

void FluidCursor::stop()
{
    if (m_state == FluidState::TornDown)
    {
        return;
    }

    m_state = FluidState::TornDown;

    if (m_hasFrameRequest)
    {
        m_hasFrameRequest = false;
        m_surface.cancelFrame(m_frameRequest);
    }

    if (m_hasInputListener)
    {
        m_hasInputListener = false;
        m_surface.removeInputListener(m_inputListener);
    }

    // An in-flight frame finishes on the resources it started with
    if (m_inFrame)
    {
        m_releasePending = true;
        return;
    }

    releaseResources_();
    std::cout << "FluidCursor: stopped" << std::endl;
}

void FluidCursor::scheduleFrame_()
{
    std::shared_ptr<FluidCursor> self = shared_from_this();
    m_frameRequest = m_surface.requestFrame([self](double nowMs) { self->onFrame_(nowMs); });
    m_hasFrameRequest = true;
}

void FluidCursor::onFrame_(double nowMs)
{
    m_hasFrameRequest = false;

    tick(nowMs);

    if (m_state == FluidState::Running)
    {
        scheduleFrame_();
    }
}

void FluidCursor::tick(double nowMs)
{
    if (m_state != FluidState::Running)
    {
        return;
    }

    float dt = 0.0f;
    if (m_hasLastUpdateTime)
    {
        dt = clampDeltaTime(nowMs, m_lastUpdateTime);
    }
    m_lastUpdateTime = nowMs;
    m_hasLastUpdateTime = true;

    updateFrame(dt);
}

void FluidCursor::updateFrame(float dt)
{
    if (m_state != FluidState::Running)
    {
        return;
    }

    PLUME_PROFILE_SCOPE();

    m_inFrame = true;
    try
    {
        renderFrame_(std::clamp(dt, 0.0f, kMaxDeltaTime));
    }
    catch (const std::exception&)
    {
        finishFrame_();
        throw;
    }
    finishFrame_();
}

void FluidCursor::renderFrame_(float dt)
{
    m_surface.makeContextCurrent();
    PLUME_PROFILE_PLOT("dt", dt);

    if (resizeIfNeeded_())
    {
        m_input.updateColors(dt, m_config.colorUpdateSpeed);
        applyInputs_();
        m_solver->step(dt);
        m_compositor->render(m_solver->dye(), m_allocatedWidth, m_allocatedHeight);
    }
    else
    {
        GL::glBindFramebuffer(GL_FRAMEBUFFER, 0);
        glClearColor(0.0f, 0.0f, 0.0f, m_config.transparent ? 0.0f : 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
    }
}

void FluidCursor::finishFrame_()
{
    m_inFrame = false;

    if (m_releasePending)
    {
        releaseResources_();
        std::cout << "FluidCursor: stopped" << std::endl;
    }
}

void FluidCursor::enqueueInput(const InputEvent& event)
{
    if (m_state == FluidState::TornDown)
    {
        return;
    }
    m_input.enqueue(event);
}

bool FluidCursor::resizeIfNeeded_()
{
    int width = 0;
    int height = 0;
    m_surface.getDrawableSize(width, height);

    if (width == m_allocatedWidth && height == m_allocatedHeight)
    {
        return width > 0 && height > 0;
    }

    m_allocatedWidth = width;
    m_allocatedHeight = height;

    if (width <= 0 || height <= 0)
    {
        return false;
    }

    try
    {
        m_solver->initFramebuffers(width, height);
    }
    catch (const std::exception& e)
    {
        std::cerr << "FluidCursor: render target reallocation for " << width << "x" << height
                  << " failed: " << e.what() << std::endl;
        return false;
    }

    return true;
}

void FluidCursor::applyInputs_()
{
    const int width = m_allocatedWidth;
    const int height = m_allocatedHeight;
    const float aspectRatio = static_cast<float>(width) / static_cast<float>(height);

    m_input.apply(width, height,
                  [this, aspectRatio](float x, float y, float dx, float dy, const Color& color) {
                      m_solver->splat(x, y, dx, dy, color, aspectRatio);
                  });
}

void FluidCursor::releaseResources_()
{
    m_releasePending = false;

    if (!m_quad)
    {
        return;
    }

    m_surface.makeContextCurrent();

    m_compositor.reset();
    m_solver.reset();
    m_pool.reset();
    m_shaders.reset();
    m_quad.reset();
}

StopFunction start(Surface& surface, const FluidConfig& config)
{
    return start(surface, config, Paths::getShaderDir());
}

StopFunction start(Surface& surface, const FluidConfig& config,
                   const std::filesystem::path& shaderDir)
{
    validateFluidConfig(config);

    const std::optional<Capabilities> capabilities = negotiateCapabilities(surface.getContext());
    if (!capabilities)
    {
        std::cerr << "FluidCursor: no usable rendering context, nothing will be drawn" << std::endl;
        return [] {};
    }

    if (!capabilities->hasRenderableFormats())
    {
        std::cerr << "FluidCursor: half-float render targets unsupported, nothing will be drawn"
                  << std::endl;
        return [] {};
    }

    std::shared_ptr<FluidCursor> cursor;
    try
    {
        cursor = std::make_shared<FluidCursor>(surface, config, *capabilities, shaderDir);
        cursor->start();
    }
    catch (const std::exception& e)
    {
        std::cerr << "FluidCursor: initialization failed: " << e.what() << std::endl;
        return [] {};
    }

    std::weak_ptr<FluidCursor> weak = cursor;
    return [weak]() {
        if (auto session = weak.lock())
        {
            session->stop();
        }
    };
}

}
