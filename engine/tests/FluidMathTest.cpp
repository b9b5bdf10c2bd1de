#include "FluidMath.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>

using namespace Plume;

TEST(FluidMathTest, ResolutionLandscape)
{
    const Resolution res = getResolution(128, 1920, 1080);
    EXPECT_EQ(res.width, 228);
    EXPECT_EQ(res.height, 128);
}

TEST(FluidMathTest, ResolutionPortrait)
{
    const Resolution res = getResolution(128, 600, 800);
    EXPECT_EQ(res.width, 128);
    EXPECT_EQ(res.height, 171);
}

TEST(FluidMathTest, ResolutionSquareForEmptyDrawable)
{
    const Resolution res = getResolution(256, 0, 0);
    EXPECT_EQ(res.width, 256);
    EXPECT_EQ(res.height, 256);
}

TEST(FluidMathTest, ResolutionFollowsDrawableAspect)
{
    const int sizes[][2] = {{800, 600}, {600, 800}, {1280, 720}, {333, 1000}, {1024, 1024},
                            {3840, 1600}};
    for (int resolution : {64, 128, 1440})
    {
        for (const auto& size : sizes)
        {
            const Resolution res = getResolution(resolution, size[0], size[1]);
            const double aspect = static_cast<double>(std::max(size[0], size[1])) /
                                  static_cast<double>(std::min(size[0], size[1]));

            EXPECT_EQ(std::min(res.width, res.height), resolution);
            EXPECT_LE(std::abs(std::max(res.width, res.height) - resolution * aspect), 0.5);
            EXPECT_EQ(res.width >= res.height, size[0] >= size[1]);
        }
    }
}

TEST(FluidMathTest, DeltaTimeIsClamped)
{
    EXPECT_FLOAT_EQ(clampDeltaTime(1010.0, 1000.0), 0.01f);
    EXPECT_FLOAT_EQ(clampDeltaTime(5000.0, 1000.0), kMaxDeltaTime);
    EXPECT_FLOAT_EQ(clampDeltaTime(900.0, 1000.0), 0.0f);
    EXPECT_FLOAT_EQ(clampDeltaTime(1000.0, 1000.0), 0.0f);
}

TEST(FluidMathTest, WrapStaysInRange)
{
    EXPECT_FLOAT_EQ(wrap(1.25f, 0.0f, 1.0f), 0.25f);
    EXPECT_FLOAT_EQ(wrap(-0.25f, 0.0f, 1.0f), 0.75f);
    EXPECT_FLOAT_EQ(wrap(1.0f, 0.0f, 1.0f), 0.0f);
    EXPECT_FLOAT_EQ(wrap(3.0f, 2.0f, 2.0f), 2.0f);

    for (float value = -5.0f; value < 5.0f; value += 0.37f)
    {
        const float wrapped = wrap(value, 0.0f, 1.0f);
        EXPECT_GE(wrapped, 0.0f) << value;
        EXPECT_LT(wrapped, 1.0f) << value;
    }
}

TEST(FluidMathTest, AspectCorrections)
{
    EXPECT_FLOAT_EQ(correctDeltaX(0.1f, 0.5f), 0.05f);
    EXPECT_FLOAT_EQ(correctDeltaX(0.1f, 2.0f), 0.1f);
    EXPECT_FLOAT_EQ(correctDeltaY(0.1f, 2.0f), 0.05f);
    EXPECT_FLOAT_EQ(correctDeltaY(0.1f, 0.5f), 0.1f);
    EXPECT_FLOAT_EQ(correctRadius(0.002f, 2.0f), 0.004f);
    EXPECT_FLOAT_EQ(correctRadius(0.002f, 0.5f), 0.002f);
}
