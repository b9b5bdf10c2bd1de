#pragma once

namespace Plume
{

constexpr float kMaxDeltaTime = 1.0f / 60.0f;

struct Resolution
{
    int width{0};
    int height{0};
};

// Grid size for a nominal resolution on a drawable of the given size. The shorter
// drawable axis gets round(resolution) cells, the longer one round(resolution * aspect).
Resolution getResolution(int resolution, int drawableWidth, int drawableHeight);

// Seconds elapsed between two millisecond timestamps, clamped to [0, kMaxDeltaTime].
float clampDeltaTime(double nowMs, double lastMs);

// Cyclic wrap into [min, max). Returns min for an empty range.
float wrap(float value, float min, float max);

float correctDeltaX(float delta, float aspectRatio);
float correctDeltaY(float delta, float aspectRatio);
float correctRadius(float radius, float aspectRatio);

}
