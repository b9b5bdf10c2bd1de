#pragma once

#include "Capabilities.hpp"
#include "Engine.hpp"
#include "Surface.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>

namespace Plume
{
namespace Testing
{

// Hidden window with the best available context. Tests skip when the machine has no GPU
// or no half-float render targets.
class GpuTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        WindowConfig window;
        window.width = 800;
        window.height = 600;
        window.visible = false;
        window.vsync = false;

        m_engine = std::make_unique<Engine>(window);
        try
        {
            m_engine->initialize();
        }
        catch (const std::exception& e)
        {
            m_engine.reset();
            GTEST_SKIP() << "No OpenGL context available: " << e.what();
        }

        const auto caps = negotiateCapabilities(m_engine->getContext());
        if (!caps || !caps->hasRenderableFormats())
        {
            m_engine.reset();
            GTEST_SKIP() << "Half-float render targets unsupported";
        }
        m_capabilities = *caps;
    }

    void TearDown() override
    {
        m_engine.reset();
    }

    std::unique_ptr<Engine> m_engine;
    Capabilities m_capabilities;
};

// Reports a chosen drawable size and forwards everything else to the engine.
class SizedSurface : public Surface
{
public:
    SizedSurface(Engine& engine, int width, int height)
        : m_engine(engine), m_width(width), m_height(height)
    {
    }

    void setSize(int width, int height)
    {
        m_width = width;
        m_height = height;
    }

    void getDrawableSize(int& width, int& height) const override
    {
        width = m_width;
        height = m_height;
    }
    const RenderContext& getContext() const override
    {
        return m_engine.getContext();
    }
    void makeContextCurrent() override
    {
        m_engine.makeContextCurrent();
    }
    FrameRequestId requestFrame(FrameCallback callback) override
    {
        return m_engine.requestFrame(std::move(callback));
    }
    void cancelFrame(FrameRequestId id) override
    {
        m_engine.cancelFrame(id);
    }
    ListenerId addInputListener(InputListener listener) override
    {
        return m_engine.addInputListener(std::move(listener));
    }
    void removeInputListener(ListenerId id) override
    {
        m_engine.removeInputListener(id);
    }

private:
    Engine& m_engine;
    int m_width;
    int m_height;
};

// Largest RGB component among texels whose center lies within `radius` (texture units)
// of (cx, cy). Pixels are RGBA, bottom row first.
inline float maxColorNear(const std::vector<float>& pixels, int width, int height, float cx,
                          float cy, float radius)
{
    float result = 0.0f;
    for (int y = 0; y < height; ++y)
    {
        for (int x = 0; x < width; ++x)
        {
            const float u = (static_cast<float>(x) + 0.5f) / static_cast<float>(width);
            const float v = (static_cast<float>(y) + 0.5f) / static_cast<float>(height);
            if (std::hypot(u - cx, v - cy) > radius)
            {
                continue;
            }
            const size_t index = (static_cast<size_t>(y) * width + x) * 4;
            for (size_t c = 0; c < 3; ++c)
            {
                result = std::max(result, pixels[index + c]);
            }
        }
    }
    return result;
}

inline bool allFinite(const std::vector<float>& pixels)
{
    for (float value : pixels)
    {
        if (!std::isfinite(value))
        {
            return false;
        }
    }
    return true;
}

}
}
