#pragma once

#include "Config.hpp"
#include "GLLoader.hpp"
#include <optional>
#include <string>
#include <vector>

struct GLFWwindow;

namespace Plume
{

enum class ContextApi
{
    OpenGL,
    OpenGLES
};

struct ContextVersion
{
    ContextApi api{ContextApi::OpenGL};
    int major{3};
    int minor{3};
};

// A window together with the context version it was created with.
struct RenderContext
{
    GLFWwindow* window{nullptr};
    ContextVersion version;

    bool isValid() const
    {
        return window != nullptr;
    }
};

struct TextureFormat
{
    GLint internalFormat{0};
    GLenum format{0};
};

struct Capabilities
{
    std::optional<TextureFormat> formatRGBA;
    std::optional<TextureFormat> formatRG;
    std::optional<TextureFormat> formatR;
    GLenum halfFloatTexType{GL_HALF_FLOAT};
    bool supportLinearFiltering{false};

    bool hasRenderableFormats() const
    {
        return formatRGBA && formatRG && formatR;
    }
};

// Newest first.
const std::vector<ContextVersion>& contextPreferenceOrder();

std::string describeContextVersion(const ContextVersion& version);

// First line of every GLSL source compiled for the given API.
std::string shaderVersionHeader(ContextApi api);

// Walks contextPreferenceOrder() and returns the first window GLFW manages to create.
// The returned context is made current. Returns an invalid context when every attempt fails.
RenderContext createWindowWithBestContext(const WindowConfig& config);

// Loads GL entry points and probes half-float render formats on the current context.
// std::nullopt means no usable context at all.
std::optional<Capabilities> negotiateCapabilities(const RenderContext& context);

// Quality downgrade for hardware without linear filtering of float textures.
FluidConfig applyCapabilities(FluidConfig config, const Capabilities& capabilities);

}
