#pragma once

#include "RenderTarget.hpp"

namespace Plume
{

class FullscreenQuad;
class Material;

// Draws the dye field onto the default framebuffer.
class Compositor
{
public:
    Compositor(Material& display, const FullscreenQuad& quad, bool shading, bool transparent);

    void render(const DoubleRenderTarget& dye, int width, int height) const;

private:
    Material& m_display;
    const FullscreenQuad& m_quad;
    bool m_shading;
    bool m_transparent;
};

}
