#pragma once

#include "Capabilities.hpp"
#include "PointerInput.hpp"
#include <cstdint>
#include <functional>

namespace Plume
{

using FrameRequestId = std::uint64_t;
using ListenerId = std::uint64_t;

// Receives the refresh timestamp in milliseconds.
using FrameCallback = std::function<void(double)>;
using InputListener = std::function<void(const InputEvent&)>;

// What the fluid core needs from its host: a drawable with a GL context, a refresh-driven
// frame scheduler and a source of pointer events. All calls happen on the host thread.
class Surface
{
public:
    virtual ~Surface() = default;

    virtual void getDrawableSize(int& width, int& height) const = 0;
    virtual const RenderContext& getContext() const = 0;
    virtual void makeContextCurrent() = 0;

    // One-shot: the callback runs once, at the next display refresh.
    virtual FrameRequestId requestFrame(FrameCallback callback) = 0;
    virtual void cancelFrame(FrameRequestId id) = 0;

    virtual ListenerId addInputListener(InputListener listener) = 0;
    virtual void removeInputListener(ListenerId id) = 0;

protected:
    Surface() = default;
};

}
