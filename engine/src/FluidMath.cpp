#include "FluidMath.hpp"
#include <algorithm>
#include <cmath>

namespace Plume
{

Resolution getResolution(int resolution, int drawableWidth, int drawableHeight)
{
    const int shortSide = static_cast<int>(std::lround(static_cast<double>(resolution)));

    if (drawableWidth <= 0 || drawableHeight <= 0)
    {
        return {shortSide, shortSide};
    }

    double aspectRatio = static_cast<double>(drawableWidth) / static_cast<double>(drawableHeight);
    if (aspectRatio < 1.0)
    {
        aspectRatio = 1.0 / aspectRatio;
    }

    const int longSide = static_cast<int>(std::lround(resolution * aspectRatio));

    if (drawableWidth > drawableHeight)
    {
        return {longSide, shortSide};
    }
    return {shortSide, longSide};
}

float clampDeltaTime(double nowMs, double lastMs)
{
    const double dt = (nowMs - lastMs) / 1000.0;
    return static_cast<float>(std::clamp(dt, 0.0, static_cast<double>(kMaxDeltaTime)));
}

float wrap(float value, float min, float max)
{
    const float range = max - min;
    if (range == 0.0f)
    {
        return min;
    }

    float offset = std::fmod(value - min, range);
    if (range > 0.0f && offset < 0.0f)
    {
        offset += range;
    }

    const float result = offset + min;
    // fmod + range can round up onto max for tiny negative offsets
    if (range > 0.0f && result >= max)
    {
        return min;
    }
    return result;
}

float correctDeltaX(float delta, float aspectRatio)
{
    if (aspectRatio < 1.0f)
    {
        delta *= aspectRatio;
    }
    return delta;
}

float correctDeltaY(float delta, float aspectRatio)
{
    if (aspectRatio > 1.0f)
    {
        delta /= aspectRatio;
    }
    return delta;
}

float correctRadius(float radius, float aspectRatio)
{
    if (aspectRatio > 1.0f)
    {
        radius *= aspectRatio;
    }
    return radius;
}

}
