#include "Capabilities.hpp"
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <cstring>
#include <iostream>

namespace
{

bool supportRenderTextureFormat(GLint internalFormat, GLenum format, GLenum type)
{
    GLuint texture = 0;
    glGenTextures(1, &texture);
    glBindTexture(GL_TEXTURE_2D, texture);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexImage2D(GL_TEXTURE_2D, 0, internalFormat, 4, 4, 0, format, type, nullptr);

    GLuint fbo = 0;
    Plume::GL::glGenFramebuffers(1, &fbo);
    Plume::GL::glBindFramebuffer(GL_FRAMEBUFFER, fbo);
    Plume::GL::glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D,
                                      texture, 0);

    const bool complete =
        Plume::GL::glCheckFramebufferStatus(GL_FRAMEBUFFER) == GL_FRAMEBUFFER_COMPLETE;

    Plume::GL::glBindFramebuffer(GL_FRAMEBUFFER, 0);
    Plume::GL::glDeleteFramebuffers(1, &fbo);
    glBindTexture(GL_TEXTURE_2D, 0);
    glDeleteTextures(1, &texture);

    // Drain errors raised by an unsupported internal format
    while (glGetError() != GL_NO_ERROR)
    {
    }

    return complete;
}

// Falls back R -> RG -> RGBA when a narrower format is not renderable
std::optional<Plume::TextureFormat> getSupportedFormat(GLint internalFormat, GLenum format,
                                                       GLenum type)
{
    if (supportRenderTextureFormat(internalFormat, format, type))
    {
        return Plume::TextureFormat{internalFormat, format};
    }

    switch (internalFormat)
    {
    case GL_R16F:
        return getSupportedFormat(GL_RG16F, GL_RG, type);
    case GL_RG16F:
        return getSupportedFormat(GL_RGBA16F, GL_RGBA, type);
    default:
        return std::nullopt;
    }
}

bool hasExtension(const char* name)
{
    GLint count = 0;
    glGetIntegerv(GL_NUM_EXTENSIONS, &count);
    for (GLint i = 0; i < count; ++i)
    {
        const auto* extension =
            reinterpret_cast<const char*>(Plume::GL::glGetStringi(GL_EXTENSIONS, i));
        if (extension && std::strcmp(extension, name) == 0)
        {
            return true;
        }
    }
    return false;
}

}

namespace Plume
{

const std::vector<ContextVersion>& contextPreferenceOrder()
{
    static const std::vector<ContextVersion> order = {
        {ContextApi::OpenGL, 4, 6},   {ContextApi::OpenGL, 4, 1},   {ContextApi::OpenGL, 3, 3},
        {ContextApi::OpenGLES, 3, 2}, {ContextApi::OpenGLES, 3, 0},
    };
    return order;
}

std::string describeContextVersion(const ContextVersion& version)
{
    const char* api = version.api == ContextApi::OpenGL ? "OpenGL " : "OpenGL ES ";
    return api + std::to_string(version.major) + "." + std::to_string(version.minor);
}

std::string shaderVersionHeader(ContextApi api)
{
    return api == ContextApi::OpenGL ? "#version 330 core\n" : "#version 300 es\n";
}

RenderContext createWindowWithBestContext(const WindowConfig& config)
{
    for (const auto& version : contextPreferenceOrder())
    {
        glfwDefaultWindowHints();
        glfwWindowHint(GLFW_VISIBLE, config.visible ? GLFW_TRUE : GLFW_FALSE);
        glfwWindowHint(GLFW_TRANSPARENT_FRAMEBUFFER, config.transparent ? GLFW_TRUE : GLFW_FALSE);
        glfwWindowHint(GLFW_DEPTH_BITS, 0);
        glfwWindowHint(GLFW_STENCIL_BITS, 0);
        glfwWindowHint(GLFW_SAMPLES, 0);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, version.major);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, version.minor);

        if (version.api == ContextApi::OpenGL)
        {
            glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_API);
            glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
            glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
        }
        else
        {
            glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_ES_API);
        }

        GLFWwindow* window =
            glfwCreateWindow(config.width, config.height, config.title.c_str(), nullptr, nullptr);
        if (window)
        {
            glfwMakeContextCurrent(window);
            std::cout << "Capabilities: created " << describeContextVersion(version)
                      << " context" << std::endl;
            return RenderContext{window, version};
        }
    }

    std::cerr << "Capabilities: no OpenGL or OpenGL ES context could be created" << std::endl;
    return RenderContext{};
}

std::optional<Capabilities> negotiateCapabilities(const RenderContext& context)
{
    if (!context.isValid())
    {
        return std::nullopt;
    }

    glfwMakeContextCurrent(context.window);

    if (!GL::loadGLFunctions())
    {
        std::cerr << "Capabilities: required GL entry points are unavailable" << std::endl;
        return std::nullopt;
    }

    Capabilities caps;
    caps.halfFloatTexType = GL_HALF_FLOAT;
    caps.formatRGBA = getSupportedFormat(GL_RGBA16F, GL_RGBA, caps.halfFloatTexType);
    caps.formatRG = getSupportedFormat(GL_RG16F, GL_RG, caps.halfFloatTexType);
    caps.formatR = getSupportedFormat(GL_R16F, GL_RED, caps.halfFloatTexType);

    if (context.version.api == ContextApi::OpenGL)
    {
        // Filtering of 16F textures is core since OpenGL 3.0
        caps.supportLinearFiltering = true;
    }
    else
    {
        caps.supportLinearFiltering = hasExtension("GL_OES_texture_float_linear");
    }

    std::cout << "Capabilities: half-float render targets "
              << (caps.hasRenderableFormats() ? "available" : "unavailable")
              << ", linear filtering " << (caps.supportLinearFiltering ? "on" : "off")
              << std::endl;

    return caps;
}

FluidConfig applyCapabilities(FluidConfig config, const Capabilities& capabilities)
{
    if (!capabilities.supportLinearFiltering)
    {
        std::cerr << "Capabilities: no linear filtering, dye resolution lowered to 256 and "
                     "shading disabled"
                  << std::endl;
        config.dyeResolution = 256;
        config.shading = false;
    }
    return config;
}

}
