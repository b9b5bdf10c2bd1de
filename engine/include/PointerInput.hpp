#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <random>
#include <vector>

namespace Plume
{

struct Color
{
    float r{0.0f};
    float g{0.0f};
    float b{0.0f};
};

// Texture-space pointer state. Y points up (bottom-left origin).
struct Pointer
{
    int id{-1};
    float texcoordX{0.0f};
    float texcoordY{0.0f};
    float prevTexcoordX{0.0f};
    float prevTexcoordY{0.0f};
    float deltaX{0.0f};
    float deltaY{0.0f};
    bool down{false};
    bool moved{false};
    Color color;
};

struct TouchPoint
{
    int id{0};
    float x{0.0f};
    float y{0.0f};
};

// Positions are drawable (framebuffer) pixels, origin top-left.
struct InputEvent
{
    enum class Type
    {
        PointerMove,
        PointerDown,
        TouchStart,
        TouchMove
    };

    Type type{Type::PointerMove};
    float x{0.0f};
    float y{0.0f};
    std::vector<TouchPoint> touches;
};

class ColorPalette
{
public:
    ColorPalette();
    explicit ColorPalette(std::uint32_t seed);

    // One of the fixed palette entries scaled down to 15% intensity.
    Color generate();

private:
    std::mt19937 m_rng;
};

// Receives (x, y) texture coordinate, (dx, dy) force and color for one splat.
using SplatSink = std::function<void(float, float, float, float, const Color&)>;

// Collects input events between ticks and turns them into splats at one point of the tick.
class InputAdapter
{
public:
    InputAdapter(float splatForce, ColorPalette palette);

    void enqueue(const InputEvent& event);

    // Drains the queue in arrival order, then splats every pointer that moved. A pointer
    // down also emits an immediate zero-force splat at ten times the color intensity.
    void apply(int drawableWidth, int drawableHeight, const SplatSink& splat);

    // Advances the color cycle; on wrap every pointer gets a fresh color.
    void updateColors(float dt, float colorUpdateSpeed);

    const Pointer& pointer() const
    {
        return m_pointers.front();
    }
    size_t pendingCount() const
    {
        return m_queue.size();
    }
    float colorTimer() const
    {
        return m_colorUpdateTimer;
    }

private:
    void updatePointerDownData_(Pointer& pointer, int id, float posX, float posY, int width,
                                int height);
    void updatePointerMoveData_(Pointer& pointer, float posX, float posY, int width, int height);

    float m_splatForce;
    ColorPalette m_palette;
    std::vector<Pointer> m_pointers;
    std::deque<InputEvent> m_queue;
    float m_colorUpdateTimer{0.0f};
};

}
