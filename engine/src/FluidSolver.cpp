#include "FluidSolver.hpp"
#include "FluidMath.hpp"
#include "FullscreenQuad.hpp"
#include "Profiling.hpp"
#include "ShaderProgram.hpp"
#include <stdexcept>

namespace Plume
{

FluidSolver::FluidSolver(const FluidConfig& config, const Capabilities& capabilities,
                         const ShaderLibrary& shaders, RenderTargetPool& pool,
                         const FullscreenQuad& quad)
    : m_config(config), m_capabilities(capabilities), m_shaders(shaders), m_pool(pool),
      m_quad(quad)
{
    if (!m_capabilities.hasRenderableFormats())
    {
        throw std::runtime_error("FluidSolver requires renderable half-float formats");
    }
}

FluidSolver::~FluidSolver()
{
    releaseTargets_();
}

RenderTargetFormat FluidSolver::formatFor_(const TextureFormat& format, GLint filter) const
{
    return RenderTargetFormat{format.internalFormat, format.format, m_capabilities.halfFloatTexType,
                              filter};
}

void FluidSolver::initFramebuffers(int drawableWidth, int drawableHeight)
{
    PLUME_PROFILE_SCOPE();

    const Resolution simRes = getResolution(m_config.simResolution, drawableWidth, drawableHeight);
    const Resolution dyeRes = getResolution(m_config.dyeResolution, drawableWidth, drawableHeight);

    const GLint filtering = m_capabilities.supportLinearFiltering ? GL_LINEAR : GL_NEAREST;
    const RenderTargetFormat rgba = formatFor_(*m_capabilities.formatRGBA, filtering);
    const RenderTargetFormat rg = formatFor_(*m_capabilities.formatRG, filtering);
    const RenderTargetFormat r = formatFor_(*m_capabilities.formatR, GL_NEAREST);

    glDisable(GL_BLEND);

    if (!m_allocated)
    {
        try
        {
            m_dye = m_pool.createDouble(dyeRes.width, dyeRes.height, rgba);
            m_velocity = m_pool.createDouble(simRes.width, simRes.height, rg);
            m_divergence = m_pool.createSingle(simRes.width, simRes.height, r);
            m_curl = m_pool.createSingle(simRes.width, simRes.height, r);
            m_pressure = m_pool.createDouble(simRes.width, simRes.height, r);
        }
        catch (const std::exception&)
        {
            m_pool.release(m_dye);
            m_pool.release(m_velocity);
            m_pool.release(m_divergence);
            m_pool.release(m_curl);
            m_pool.release(m_pressure);
            throw;
        }
        m_allocated = true;
        return;
    }

    // Every replacement is built before any current field is touched, so a failed allocation
    // leaves the solver on its previous, consistent set of fields.
    const bool dyeChanged = m_dye.width() != dyeRes.width || m_dye.height() != dyeRes.height;
    const bool velocityChanged =
        m_velocity.width() != simRes.width || m_velocity.height() != simRes.height;

    DoubleRenderTarget dye;
    DoubleRenderTarget velocity;
    RenderTarget divergence;
    RenderTarget curl;
    DoubleRenderTarget pressure;
    try
    {
        if (dyeChanged)
        {
            dye = m_pool.createResized(m_dye, dyeRes.width, dyeRes.height, rgba, m_shaders.copy(),
                                       m_quad);
        }
        if (velocityChanged)
        {
            velocity = m_pool.createResized(m_velocity, simRes.width, simRes.height, rg,
                                            m_shaders.copy(), m_quad);
        }
        divergence = m_pool.createSingle(simRes.width, simRes.height, r);
        curl = m_pool.createSingle(simRes.width, simRes.height, r);
        pressure = m_pool.createDouble(simRes.width, simRes.height, r);
    }
    catch (const std::exception&)
    {
        // release() ignores handles the pool does not hold, so unset slots are harmless
        m_pool.release(dye);
        m_pool.release(velocity);
        m_pool.release(divergence);
        m_pool.release(curl);
        m_pool.release(pressure);
        throw;
    }

    if (dyeChanged)
    {
        m_pool.release(m_dye);
        m_dye = dye;
    }
    if (velocityChanged)
    {
        m_pool.release(m_velocity);
        m_velocity = velocity;
    }
    m_pool.release(m_divergence);
    m_pool.release(m_curl);
    m_pool.release(m_pressure);

    m_divergence = divergence;
    m_curl = curl;
    m_pressure = pressure;
}

void FluidSolver::releaseTargets_()
{
    if (!m_allocated)
    {
        return;
    }

    m_pool.release(m_dye);
    m_pool.release(m_velocity);
    m_pool.release(m_pressure);
    m_pool.release(m_divergence);
    m_pool.release(m_curl);
    m_allocated = false;
}

void FluidSolver::step(float dt)
{
    PLUME_PROFILE_SCOPE();

    glDisable(GL_BLEND);

    computeCurl();
    applyVorticity(dt);
    computeDivergence();
    clearPressure();
    solvePressure(m_config.pressureIterations);
    subtractGradient();
    advectVelocity(dt);
    advectDye(dt);
}

void FluidSolver::computeCurl()
{
    const ShaderProgram& program = m_shaders.curl();
    program.bind();
    program.setVec2(Uniform::TexelSize, m_velocity.texelSizeX(), m_velocity.texelSizeY());
    program.setInt(Uniform::Velocity, m_velocity.read().attach(0));
    m_quad.blit(m_curl);
}

void FluidSolver::applyVorticity(float dt)
{
    const ShaderProgram& program = m_shaders.vorticity();
    program.bind();
    program.setVec2(Uniform::TexelSize, m_velocity.texelSizeX(), m_velocity.texelSizeY());
    program.setInt(Uniform::Velocity, m_velocity.read().attach(0));
    program.setInt(Uniform::Curl, m_curl.attach(1));
    program.setFloat(Uniform::CurlStrength, m_config.curl);
    program.setFloat(Uniform::Dt, dt);
    m_quad.blit(m_velocity.write());
    m_velocity.swap();
}

void FluidSolver::computeDivergence()
{
    const ShaderProgram& program = m_shaders.divergence();
    program.bind();
    program.setVec2(Uniform::TexelSize, m_velocity.texelSizeX(), m_velocity.texelSizeY());
    program.setInt(Uniform::Velocity, m_velocity.read().attach(0));
    m_quad.blit(m_divergence);
}

void FluidSolver::clearPressure()
{
    const ShaderProgram& program = m_shaders.clear();
    program.bind();
    program.setInt(Uniform::Texture, m_pressure.read().attach(0));
    program.setFloat(Uniform::Value, m_config.pressure);
    m_quad.blit(m_pressure.write());
    m_pressure.swap();
}

void FluidSolver::solvePressure(int iterations)
{
    PLUME_PROFILE_SCOPE();

    const ShaderProgram& program = m_shaders.pressure();
    program.bind();
    program.setVec2(Uniform::TexelSize, m_velocity.texelSizeX(), m_velocity.texelSizeY());
    program.setInt(Uniform::Divergence, m_divergence.attach(0));
    for (int i = 0; i < iterations; ++i)
    {
        program.setInt(Uniform::Pressure, m_pressure.read().attach(1));
        m_quad.blit(m_pressure.write());
        m_pressure.swap();
    }
}

void FluidSolver::subtractGradient()
{
    const ShaderProgram& program = m_shaders.gradientSubtract();
    program.bind();
    program.setVec2(Uniform::TexelSize, m_velocity.texelSizeX(), m_velocity.texelSizeY());
    program.setInt(Uniform::Pressure, m_pressure.read().attach(0));
    program.setInt(Uniform::Velocity, m_velocity.read().attach(1));
    m_quad.blit(m_velocity.write());
    m_velocity.swap();
}

void FluidSolver::advectVelocity(float dt)
{
    const ShaderProgram& program = m_shaders.advection().active();
    program.bind();
    program.setVec2(Uniform::TexelSize, m_velocity.texelSizeX(), m_velocity.texelSizeY());
    program.setVec2(Uniform::DyeTexelSize, m_velocity.texelSizeX(), m_velocity.texelSizeY());
    const GLint velocityUnit = m_velocity.read().attach(0);
    program.setInt(Uniform::Velocity, velocityUnit);
    program.setInt(Uniform::Source, velocityUnit);
    program.setFloat(Uniform::Dt, dt);
    program.setFloat(Uniform::Dissipation, m_config.velocityDissipation);
    m_quad.blit(m_velocity.write());
    m_velocity.swap();
}

void FluidSolver::advectDye(float dt)
{
    const ShaderProgram& program = m_shaders.advection().active();
    program.bind();
    program.setVec2(Uniform::TexelSize, m_velocity.texelSizeX(), m_velocity.texelSizeY());
    program.setVec2(Uniform::DyeTexelSize, m_dye.texelSizeX(), m_dye.texelSizeY());
    program.setInt(Uniform::Velocity, m_velocity.read().attach(0));
    program.setInt(Uniform::Source, m_dye.read().attach(1));
    program.setFloat(Uniform::Dt, dt);
    program.setFloat(Uniform::Dissipation, m_config.densityDissipation);
    m_quad.blit(m_dye.write());
    m_dye.swap();
}

void FluidSolver::splat(float x, float y, float dx, float dy, const Color& color,
                        float aspectRatio)
{
    glDisable(GL_BLEND);

    const ShaderProgram& program = m_shaders.splat();
    program.bind();
    program.setInt(Uniform::Target, m_velocity.read().attach(0));
    program.setFloat(Uniform::AspectRatio, aspectRatio);
    program.setVec2(Uniform::Point, x, y);
    program.setVec3(Uniform::Color, dx, dy, 0.0f);
    program.setFloat(Uniform::Radius, correctRadius(m_config.splatRadius / 100.0f, aspectRatio));
    m_quad.blit(m_velocity.write());
    m_velocity.swap();

    program.setInt(Uniform::Target, m_dye.read().attach(0));
    program.setVec3(Uniform::Color, color.r, color.g, color.b);
    m_quad.blit(m_dye.write());
    m_dye.swap();
}

}
