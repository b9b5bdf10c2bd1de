#include "Compositor.hpp"
#include "FullscreenQuad.hpp"
#include "Profiling.hpp"
#include "ShaderProgram.hpp"

namespace Plume
{

Compositor::Compositor(Material& display, const FullscreenQuad& quad, bool shading,
                       bool transparent)
    : m_display(display), m_quad(quad), m_shading(shading), m_transparent(transparent)
{
    std::vector<std::string> keywords;
    if (m_shading)
    {
        keywords.push_back("SHADING");
    }
    m_display.setKeywords(keywords);
}

void Compositor::render(const DoubleRenderTarget& dye, int width, int height) const
{
    PLUME_PROFILE_SCOPE();

    if (width <= 0 || height <= 0)
    {
        return;
    }

    GL::glBindFramebuffer(GL_FRAMEBUFFER, 0);
    glViewport(0, 0, width, height);
    glClearColor(0.0f, 0.0f, 0.0f, m_transparent ? 0.0f : 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    const ShaderProgram& program = m_display.active();
    program.bind();
    if (m_shading)
    {
        program.setVec2(Uniform::TexelSize, 1.0f / static_cast<float>(width),
                        1.0f / static_cast<float>(height));
    }
    program.setInt(Uniform::Texture, dye.read().attach(0));
    m_quad.blitToSurface(width, height);

    glDisable(GL_BLEND);
}

}
