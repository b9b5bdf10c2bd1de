#include "FullscreenQuad.hpp"
#include "RenderTarget.hpp"

namespace Plume
{

FullscreenQuad::~FullscreenQuad()
{
    shutdown();
}

void FullscreenQuad::initialize()
{
    if (m_vao)
    {
        return;
    }

    // clip-space corners, uv is derived in the vertex shader
    const float vertices[] = {
        -1.0f, -1.0f, // bottom-left
        -1.0f, 1.0f,  // top-left
        1.0f,  1.0f,  // top-right
        1.0f,  -1.0f, // bottom-right
    };
    const GLushort indices[] = {0, 1, 2, 0, 2, 3};

    GL::glGenVertexArrays(1, &m_vao);
    GL::glGenBuffers(1, &m_vbo);
    GL::glGenBuffers(1, &m_ebo);

    GL::glBindVertexArray(m_vao);

    GL::glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    GL::glBufferData(GL_ARRAY_BUFFER, sizeof(vertices), vertices, GL_STATIC_DRAW);

    GL::glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, m_ebo);
    GL::glBufferData(GL_ELEMENT_ARRAY_BUFFER, sizeof(indices), indices, GL_STATIC_DRAW);

    // Position attribute
    GL::glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 2 * sizeof(float), nullptr);
    GL::glEnableVertexAttribArray(0);

    GL::glBindVertexArray(0);
}

void FullscreenQuad::shutdown()
{
    if (m_vao)
    {
        GL::glDeleteVertexArrays(1, &m_vao);
        m_vao = 0;
    }

    if (m_vbo)
    {
        GL::glDeleteBuffers(1, &m_vbo);
        m_vbo = 0;
    }

    if (m_ebo)
    {
        GL::glDeleteBuffers(1, &m_ebo);
        m_ebo = 0;
    }
}

void FullscreenQuad::blit(const RenderTarget& target) const
{
    glViewport(0, 0, target.width, target.height);
    GL::glBindFramebuffer(GL_FRAMEBUFFER, target.fbo);
    draw_();
}

void FullscreenQuad::blitToSurface(int width, int height) const
{
    glViewport(0, 0, width, height);
    GL::glBindFramebuffer(GL_FRAMEBUFFER, 0);
    draw_();
}

void FullscreenQuad::draw_() const
{
    GL::glBindVertexArray(m_vao);
    glDrawElements(GL_TRIANGLES, 6, GL_UNSIGNED_SHORT, nullptr);
    GL::glBindVertexArray(0);
}

}
