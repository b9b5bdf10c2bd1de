#include "EngineConfig.hpp"
#include "FullscreenQuad.hpp"
#include "GpuTestSupport.hpp"
#include "RenderTarget.hpp"
#include "ShaderProgram.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace Plume;

TEST(DoubleRenderTargetTest, SwapExchangesRoles)
{
    const RenderTarget a{1, 2, 4, 4, 0.25f, 0.25f};
    const RenderTarget b{3, 4, 4, 4, 0.25f, 0.25f};
    DoubleRenderTarget pair(a, b);

    pair.swap();
    EXPECT_EQ(pair.read().texture, 3u);
    EXPECT_EQ(pair.write().texture, 1u);

    pair.swap();
    EXPECT_EQ(pair.read().texture, 1u);
    EXPECT_EQ(pair.read().fbo, 2u);
    EXPECT_EQ(pair.write().texture, 3u);
    EXPECT_EQ(pair.write().fbo, 4u);
}

TEST(DoubleRenderTargetTest, ReportsReadSideGeometry)
{
    const RenderTarget a{1, 2, 8, 4, 0.125f, 0.25f};
    DoubleRenderTarget pair(a, a);
    EXPECT_EQ(pair.width(), 8);
    EXPECT_EQ(pair.height(), 4);
    EXPECT_FLOAT_EQ(pair.texelSizeX(), 0.125f);
    EXPECT_FLOAT_EQ(pair.texelSizeY(), 0.25f);
}

class RenderTargetGpuTest : public Testing::GpuTest
{
protected:
    RenderTargetFormat rgba() const
    {
        return RenderTargetFormat{m_capabilities.formatRGBA->internalFormat,
                                  m_capabilities.formatRGBA->format,
                                  m_capabilities.halfFloatTexType, GL_NEAREST};
    }

    void fill(const RenderTarget& target, float r, float g, float b, float a)
    {
        GL::glBindFramebuffer(GL_FRAMEBUFFER, target.fbo);
        glViewport(0, 0, target.width, target.height);
        glClearColor(r, g, b, a);
        glClear(GL_COLOR_BUFFER_BIT);
        GL::glBindFramebuffer(GL_FRAMEBUFFER, 0);
    }
};

TEST_F(RenderTargetGpuTest, CreateSingleIsClearedAndSized)
{
    RenderTargetPool pool;
    const RenderTarget target = pool.createSingle(16, 8, rgba());

    EXPECT_EQ(target.width, 16);
    EXPECT_EQ(target.height, 8);
    EXPECT_FLOAT_EQ(target.texelSizeX, 1.0f / 16.0f);
    EXPECT_FLOAT_EQ(target.texelSizeY, 1.0f / 8.0f);
    EXPECT_EQ(pool.liveCount(), 1u);

    const std::vector<float> pixels = pool.readPixels(target);
    ASSERT_EQ(pixels.size(), 16u * 8u * 4u);
    for (float value : pixels)
    {
        EXPECT_FLOAT_EQ(value, 0.0f);
    }
}

TEST_F(RenderTargetGpuTest, NonPositiveSizeThrows)
{
    RenderTargetPool pool;
    EXPECT_THROW(pool.createSingle(0, 4, rgba()), std::runtime_error);
    EXPECT_THROW(pool.createDouble(4, -1, rgba()), std::runtime_error);
    EXPECT_EQ(pool.liveCount(), 0u);
}

TEST_F(RenderTargetGpuTest, ReleaseFreesTargets)
{
    RenderTargetPool pool;
    const DoubleRenderTarget pair = pool.createDouble(8, 8, rgba());
    const RenderTarget single = pool.createSingle(8, 8, rgba());
    EXPECT_EQ(pool.liveCount(), 3u);

    pool.release(pair);
    EXPECT_EQ(pool.liveCount(), 1u);

    // releasing twice is harmless
    pool.release(pair);
    EXPECT_EQ(pool.liveCount(), 1u);

    pool.releaseAll();
    EXPECT_EQ(pool.liveCount(), 0u);
    (void)single;
}

TEST_F(RenderTargetGpuTest, ResizeToSameSizeIsNoOp)
{
    FullscreenQuad quad;
    quad.initialize();
    ShaderLibrary shaders(Paths::getShaderDir(), m_engine->getContext().version.api,
                          m_capabilities.supportLinearFiltering);
    RenderTargetPool pool;

    const DoubleRenderTarget pair = pool.createDouble(8, 8, rgba());
    const DoubleRenderTarget same = pool.resizeDouble(pair, 8, 8, rgba(), shaders.copy(), quad);

    EXPECT_EQ(same.read().texture, pair.read().texture);
    EXPECT_EQ(same.write().texture, pair.write().texture);
    EXPECT_EQ(pool.liveCount(), 2u);
}

TEST_F(RenderTargetGpuTest, ResizeCarriesContent)
{
    FullscreenQuad quad;
    quad.initialize();
    ShaderLibrary shaders(Paths::getShaderDir(), m_engine->getContext().version.api,
                          m_capabilities.supportLinearFiltering);
    RenderTargetPool pool;

    const DoubleRenderTarget pair = pool.createDouble(8, 8, rgba());
    fill(pair.read(), 0.5f, 0.25f, 0.0f, 1.0f);

    const DoubleRenderTarget resized =
        pool.resizeDouble(pair, 16, 12, rgba(), shaders.copy(), quad);

    EXPECT_EQ(resized.width(), 16);
    EXPECT_EQ(resized.height(), 12);
    EXPECT_EQ(resized.write().width, 16);
    EXPECT_EQ(pool.liveCount(), 2u);

    const std::vector<float> pixels = pool.readPixels(resized.read());
    for (size_t i = 0; i < pixels.size(); i += 4)
    {
        EXPECT_NEAR(pixels[i], 0.5f, 1e-3f);
        EXPECT_NEAR(pixels[i + 1], 0.25f, 1e-3f);
        EXPECT_NEAR(pixels[i + 2], 0.0f, 1e-3f);
    }
}

TEST_F(RenderTargetGpuTest, CreateResizedLeavesSourceLive)
{
    FullscreenQuad quad;
    quad.initialize();
    ShaderLibrary shaders(Paths::getShaderDir(), m_engine->getContext().version.api,
                          m_capabilities.supportLinearFiltering);
    RenderTargetPool pool;

    const DoubleRenderTarget pair = pool.createDouble(8, 8, rgba());
    fill(pair.read(), 0.5f, 0.0f, 0.0f, 1.0f);

    const DoubleRenderTarget resized =
        pool.createResized(pair, 16, 12, rgba(), shaders.copy(), quad);
    EXPECT_EQ(pool.liveCount(), 4u);
    EXPECT_NE(resized.read().texture, pair.read().texture);
    EXPECT_NEAR(pool.readPixels(resized.read())[0], 0.5f, 1e-3f);
    EXPECT_NEAR(pool.readPixels(pair.read())[0], 0.5f, 1e-3f);

    pool.release(pair);
    EXPECT_EQ(pool.liveCount(), 2u);
}
