#pragma once

#include "GLLoader.hpp"
#include <cstddef>
#include <utility>
#include <vector>

namespace Plume
{

class FullscreenQuad;
class ShaderProgram;

// Texture plus framebuffer. Plain handles; the RenderTargetPool owns the GL objects.
struct RenderTarget
{
    GLuint texture{0};
    GLuint fbo{0};
    int width{0};
    int height{0};
    float texelSizeX{0.0f};
    float texelSizeY{0.0f};

    // Binds the texture to the sampling unit and returns the unit for use as a sampler value.
    GLint attach(GLint unit) const;
};

// Read/write pair of equally sized targets. swap() only exchanges the designations.
class DoubleRenderTarget
{
public:
    DoubleRenderTarget() = default;
    DoubleRenderTarget(const RenderTarget& read, const RenderTarget& write)
        : m_read(read), m_write(write)
    {
    }

    const RenderTarget& read() const
    {
        return m_read;
    }
    const RenderTarget& write() const
    {
        return m_write;
    }

    void swap()
    {
        std::swap(m_read, m_write);
    }

    int width() const
    {
        return m_read.width;
    }
    int height() const
    {
        return m_read.height;
    }
    float texelSizeX() const
    {
        return m_read.texelSizeX;
    }
    float texelSizeY() const
    {
        return m_read.texelSizeY;
    }

private:
    RenderTarget m_read;
    RenderTarget m_write;
};

struct RenderTargetFormat
{
    GLint internalFormat{GL_RGBA16F};
    GLenum format{GL_RGBA};
    GLenum type{GL_HALF_FLOAT};
    GLint filter{GL_LINEAR};
};

class RenderTargetPool
{
public:
    RenderTargetPool() = default;
    ~RenderTargetPool();

    RenderTargetPool(const RenderTargetPool&) = delete;
    RenderTargetPool& operator=(const RenderTargetPool&) = delete;

    // Allocates a zero-cleared target. Throws std::runtime_error if the framebuffer is incomplete.
    RenderTarget createSingle(int width, int height, const RenderTargetFormat& format);
    DoubleRenderTarget createDouble(int width, int height, const RenderTargetFormat& format);

    // Copies the read side of `existing` into a fresh target of the new size and allocates a
    // fresh write target. `existing` stays live; on failure nothing new is left allocated.
    DoubleRenderTarget createResized(const DoubleRenderTarget& existing, int width, int height,
                                     const RenderTargetFormat& format,
                                     const ShaderProgram& copyProgram, const FullscreenQuad& quad);

    // createResized followed by releasing the old pair. Same size returns `existing` untouched.
    DoubleRenderTarget resizeDouble(const DoubleRenderTarget& existing, int width, int height,
                                    const RenderTargetFormat& format,
                                    const ShaderProgram& copyProgram, const FullscreenQuad& quad);

    void release(const RenderTarget& target);
    void release(const DoubleRenderTarget& target);
    void releaseAll();

    // RGBA float texels, bottom row first.
    std::vector<float> readPixels(const RenderTarget& target) const;

    size_t liveCount() const
    {
        return m_live.size();
    }

private:
    std::vector<RenderTarget> m_live;
};

}
