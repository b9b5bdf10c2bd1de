#pragma once

#include "GLLoader.hpp"

namespace Plume
{

struct RenderTarget;

// Two-triangle quad covering clip space. Every simulation pass is one draw of it.
class FullscreenQuad
{
public:
    FullscreenQuad() = default;
    ~FullscreenQuad();

    FullscreenQuad(const FullscreenQuad&) = delete;
    FullscreenQuad& operator=(const FullscreenQuad&) = delete;

    void initialize();
    void shutdown();

    // Draws into the target's framebuffer with a viewport matching its size.
    void blit(const RenderTarget& target) const;

    // Draws into the default framebuffer.
    void blitToSurface(int width, int height) const;

private:
    void draw_() const;

    GLuint m_vao{0};
    GLuint m_vbo{0};
    GLuint m_ebo{0};
};

}
