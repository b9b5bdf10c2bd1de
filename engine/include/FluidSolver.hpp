#pragma once

#include "Capabilities.hpp"
#include "Config.hpp"
#include "PointerInput.hpp"
#include "RenderTarget.hpp"

namespace Plume
{

class FullscreenQuad;
class ShaderLibrary;

// GPU-resident Eulerian solver. Velocity and pressure live at simulation resolution,
// dye at dye resolution; every pass is one full-screen draw into a pool target.
class FluidSolver
{
public:
    FluidSolver(const FluidConfig& config, const Capabilities& capabilities,
                const ShaderLibrary& shaders, RenderTargetPool& pool,
                const FullscreenQuad& quad);
    ~FluidSolver();

    FluidSolver(const FluidSolver&) = delete;
    FluidSolver& operator=(const FluidSolver&) = delete;

    // Allocates every field for the drawable size. On later calls velocity and dye are
    // resized with their content; divergence, curl and pressure are recreated. If any
    // allocation throws, the previous fields stay live and unchanged.
    void initFramebuffers(int drawableWidth, int drawableHeight);

    // Advances velocity and dye by dt seconds.
    void step(float dt);

    void computeCurl();
    void applyVorticity(float dt);
    void computeDivergence();
    void clearPressure();
    void solvePressure(int iterations);
    void subtractGradient();
    void advectVelocity(float dt);
    void advectDye(float dt);

    // Gaussian injection of (dx, dy) into velocity and color into dye at texture coordinate (x, y).
    void splat(float x, float y, float dx, float dy, const Color& color, float aspectRatio);

    const DoubleRenderTarget& velocity() const
    {
        return m_velocity;
    }
    const DoubleRenderTarget& dye() const
    {
        return m_dye;
    }
    const DoubleRenderTarget& pressure() const
    {
        return m_pressure;
    }
    const RenderTarget& divergence() const
    {
        return m_divergence;
    }
    const RenderTarget& curl() const
    {
        return m_curl;
    }

private:
    RenderTargetFormat formatFor_(const TextureFormat& format, GLint filter) const;
    void releaseTargets_();

    FluidConfig m_config;
    Capabilities m_capabilities;
    const ShaderLibrary& m_shaders;
    RenderTargetPool& m_pool;
    const FullscreenQuad& m_quad;

    DoubleRenderTarget m_dye;
    DoubleRenderTarget m_velocity;
    DoubleRenderTarget m_pressure;
    RenderTarget m_divergence;
    RenderTarget m_curl;
    bool m_allocated{false};
};

}
