#include "PointerInput.hpp"
#include "FluidMath.hpp"
#include <array>
#include <cmath>
#include <utility>

namespace
{

constexpr std::array<Plume::Color, 3> kPalette = {{
    {1.0f, 0.224f, 0.216f},
    {1.0f, 0.216f, 0.6f},
    {1.0f, 0.616f, 0.216f},
}};

constexpr float kPaletteIntensity = 0.15f;
constexpr float kPointerDownBoost = 10.0f;

}

namespace Plume
{

ColorPalette::ColorPalette() : m_rng(std::random_device{}()) {}

ColorPalette::ColorPalette(std::uint32_t seed) : m_rng(seed) {}

Color ColorPalette::generate()
{
    std::uniform_int_distribution<size_t> pick(0, kPalette.size() - 1);
    const Color& selected = kPalette[pick(m_rng)];
    return {selected.r * kPaletteIntensity, selected.g * kPaletteIntensity,
            selected.b * kPaletteIntensity};
}

InputAdapter::InputAdapter(float splatForce, ColorPalette palette)
    : m_splatForce(splatForce), m_palette(std::move(palette)), m_pointers(1)
{
}

void InputAdapter::enqueue(const InputEvent& event)
{
    m_queue.push_back(event);
}

void InputAdapter::apply(int drawableWidth, int drawableHeight, const SplatSink& splat)
{
    if (drawableWidth <= 0 || drawableHeight <= 0)
    {
        m_queue.clear();
        return;
    }

    // multi-touch fans into the single logical pointer
    Pointer& pointer = m_pointers.front();

    while (!m_queue.empty())
    {
        const InputEvent event = std::move(m_queue.front());
        m_queue.pop_front();

        switch (event.type)
        {
        case InputEvent::Type::PointerMove:
            updatePointerMoveData_(pointer, event.x, event.y, drawableWidth, drawableHeight);
            break;

        case InputEvent::Type::PointerDown:
        {
            updatePointerDownData_(pointer, -1, event.x, event.y, drawableWidth, drawableHeight);
            Color color = m_palette.generate();
            color.r *= kPointerDownBoost;
            color.g *= kPointerDownBoost;
            color.b *= kPointerDownBoost;
            splat(pointer.texcoordX, pointer.texcoordY, 0.0f, 0.0f, color);
            break;
        }

        case InputEvent::Type::TouchStart:
            for (const auto& touch : event.touches)
            {
                updatePointerDownData_(pointer, touch.id, touch.x, touch.y, drawableWidth,
                                       drawableHeight);
            }
            break;

        case InputEvent::Type::TouchMove:
            for (const auto& touch : event.touches)
            {
                updatePointerMoveData_(pointer, touch.x, touch.y, drawableWidth, drawableHeight);
            }
            break;
        }
    }

    for (auto& p : m_pointers)
    {
        if (p.moved)
        {
            p.moved = false;
            splat(p.texcoordX, p.texcoordY, p.deltaX * m_splatForce, p.deltaY * m_splatForce,
                  p.color);
        }
    }
}

void InputAdapter::updateColors(float dt, float colorUpdateSpeed)
{
    m_colorUpdateTimer += dt * colorUpdateSpeed;
    if (m_colorUpdateTimer >= 1.0f)
    {
        m_colorUpdateTimer = wrap(m_colorUpdateTimer, 0.0f, 1.0f);
        for (auto& p : m_pointers)
        {
            p.color = m_palette.generate();
        }
    }
}

void InputAdapter::updatePointerDownData_(Pointer& pointer, int id, float posX, float posY,
                                          int width, int height)
{
    pointer.id = id;
    pointer.down = true;
    pointer.moved = false;
    pointer.texcoordX = posX / static_cast<float>(width);
    pointer.texcoordY = 1.0f - posY / static_cast<float>(height);
    pointer.prevTexcoordX = pointer.texcoordX;
    pointer.prevTexcoordY = pointer.texcoordY;
    pointer.deltaX = 0.0f;
    pointer.deltaY = 0.0f;
    pointer.color = m_palette.generate();
}

void InputAdapter::updatePointerMoveData_(Pointer& pointer, float posX, float posY, int width,
                                          int height)
{
    const float aspectRatio = static_cast<float>(width) / static_cast<float>(height);

    pointer.prevTexcoordX = pointer.texcoordX;
    pointer.prevTexcoordY = pointer.texcoordY;
    pointer.texcoordX = posX / static_cast<float>(width);
    pointer.texcoordY = 1.0f - posY / static_cast<float>(height);
    pointer.deltaX = correctDeltaX(pointer.texcoordX - pointer.prevTexcoordX, aspectRatio);
    pointer.deltaY = correctDeltaY(pointer.texcoordY - pointer.prevTexcoordY, aspectRatio);
    pointer.moved = std::abs(pointer.deltaX) > 0.0f || std::abs(pointer.deltaY) > 0.0f;
}

}
