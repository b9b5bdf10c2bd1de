#include "RenderTarget.hpp"
#include "FullscreenQuad.hpp"
#include "ShaderProgram.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace
{

GLuint createTexture2D(const Plume::RenderTargetFormat& format, int width, int height)
{
    GLuint texture;
    glGenTextures(1, &texture);
    glBindTexture(GL_TEXTURE_2D, texture);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, format.filter);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, format.filter);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexImage2D(GL_TEXTURE_2D, 0, format.internalFormat, width, height, 0, format.format,
                 format.type, nullptr);
    return texture;
}

}

namespace Plume
{

GLint RenderTarget::attach(GLint unit) const
{
    GL::glActiveTexture(GL_TEXTURE0 + unit);
    glBindTexture(GL_TEXTURE_2D, texture);
    return unit;
}

RenderTargetPool::~RenderTargetPool()
{
    releaseAll();
}

RenderTarget RenderTargetPool::createSingle(int width, int height,
                                            const RenderTargetFormat& format)
{
    if (width <= 0 || height <= 0)
    {
        throw std::runtime_error("Render target size must be positive, got " +
                                 std::to_string(width) + "x" + std::to_string(height));
    }

    GL::glActiveTexture(GL_TEXTURE0);

    RenderTarget target;
    target.texture = createTexture2D(format, width, height);

    GL::glGenFramebuffers(1, &target.fbo);
    GL::glBindFramebuffer(GL_FRAMEBUFFER, target.fbo);
    GL::glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D,
                               target.texture, 0);

    if (GL::glCheckFramebufferStatus(GL_FRAMEBUFFER) != GL_FRAMEBUFFER_COMPLETE)
    {
        GL::glBindFramebuffer(GL_FRAMEBUFFER, 0);
        GL::glDeleteFramebuffers(1, &target.fbo);
        glDeleteTextures(1, &target.texture);
        throw std::runtime_error("Render target " + std::to_string(width) + "x" +
                                 std::to_string(height) + " framebuffer not complete");
    }

    glViewport(0, 0, width, height);
    glClearColor(0.0f, 0.0f, 0.0f, 0.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    target.width = width;
    target.height = height;
    target.texelSizeX = 1.0f / static_cast<float>(width);
    target.texelSizeY = 1.0f / static_cast<float>(height);

    m_live.push_back(target);
    return target;
}

DoubleRenderTarget RenderTargetPool::createDouble(int width, int height,
                                                  const RenderTargetFormat& format)
{
    RenderTarget first = createSingle(width, height, format);
    try
    {
        return DoubleRenderTarget(first, createSingle(width, height, format));
    }
    catch (const std::exception&)
    {
        release(first);
        throw;
    }
}

DoubleRenderTarget RenderTargetPool::createResized(const DoubleRenderTarget& existing, int width,
                                                   int height, const RenderTargetFormat& format,
                                                   const ShaderProgram& copyProgram,
                                                   const FullscreenQuad& quad)
{
    RenderTarget resized = createSingle(width, height, format);

    glDisable(GL_BLEND);
    copyProgram.bind();
    copyProgram.setInt(Uniform::Texture, existing.read().attach(0));
    quad.blit(resized);

    RenderTarget write;
    try
    {
        write = createSingle(width, height, format);
    }
    catch (const std::exception&)
    {
        release(resized);
        throw;
    }

    return DoubleRenderTarget(resized, write);
}

DoubleRenderTarget RenderTargetPool::resizeDouble(const DoubleRenderTarget& existing, int width,
                                                  int height, const RenderTargetFormat& format,
                                                  const ShaderProgram& copyProgram,
                                                  const FullscreenQuad& quad)
{
    if (existing.width() == width && existing.height() == height)
    {
        return existing;
    }

    const DoubleRenderTarget resized =
        createResized(existing, width, height, format, copyProgram, quad);
    release(existing);
    return resized;
}

void RenderTargetPool::release(const RenderTarget& target)
{
    auto it = std::find_if(m_live.begin(), m_live.end(), [&](const RenderTarget& live) {
        return live.fbo == target.fbo && live.texture == target.texture;
    });
    if (it == m_live.end())
    {
        return;
    }

    GL::glDeleteFramebuffers(1, &it->fbo);
    glDeleteTextures(1, &it->texture);
    m_live.erase(it);
}

void RenderTargetPool::release(const DoubleRenderTarget& target)
{
    release(target.read());
    release(target.write());
}

void RenderTargetPool::releaseAll()
{
    for (auto& target : m_live)
    {
        GL::glDeleteFramebuffers(1, &target.fbo);
        glDeleteTextures(1, &target.texture);
    }
    m_live.clear();
}

std::vector<float> RenderTargetPool::readPixels(const RenderTarget& target) const
{
    std::vector<float> pixels(static_cast<size_t>(target.width) *
                              static_cast<size_t>(target.height) * 4);

    GL::glBindFramebuffer(GL_FRAMEBUFFER, target.fbo);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadPixels(0, 0, target.width, target.height, GL_RGBA, GL_FLOAT, pixels.data());
    GL::glBindFramebuffer(GL_FRAMEBUFFER, 0);

    return pixels;
}

}
