#pragma once

#include "Capabilities.hpp"
#include "GLLoader.hpp"
#include <array>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Plume
{

// Every uniform used by the fluid programs. Locations are resolved once per program at
// link time; a program that lacks a uniform stores -1, which GL treats as a no-op set.
enum class Uniform : int
{
    TexelSize,
    DyeTexelSize,
    Texture,
    Target,
    Velocity,
    Source,
    Curl,
    Pressure,
    Divergence,
    Value,
    AspectRatio,
    Color,
    Point,
    Radius,
    Dt,
    Dissipation,
    CurlStrength,
    Count
};

const char* uniformName(Uniform uniform);

class ShaderProgram
{
public:
    // Takes ownership of a linked program.
    explicit ShaderProgram(GLuint program);
    ~ShaderProgram();

    ShaderProgram(const ShaderProgram&) = delete;
    ShaderProgram& operator=(const ShaderProgram&) = delete;

    void bind() const;

    GLint location(Uniform uniform) const
    {
        return m_locations[static_cast<size_t>(uniform)];
    }

    void setInt(Uniform uniform, GLint value) const;
    void setFloat(Uniform uniform, float value) const;
    void setVec2(Uniform uniform, float x, float y) const;
    void setVec3(Uniform uniform, float x, float y, float z) const;

    GLuint handle() const
    {
        return m_program;
    }

private:
    GLuint m_program{0};
    std::array<GLint, static_cast<size_t>(Uniform::Count)> m_locations;
};

// Sorted, de-duplicated keywords, each terminated by ';'. Distinct sets never share a key.
std::string makeKeywordKey(std::vector<std::string> keywords);

// Version header, one #define per keyword, then the body.
std::string composeShaderSource(const std::string& versionHeader,
                                const std::vector<std::string>& keywords,
                                const std::string& body);

std::string readShaderFile(const std::filesystem::path& path);

// Throws std::runtime_error with the driver log on failure.
GLuint compileShader(GLenum shaderType, const std::string& source, const std::string& shaderName);
GLuint linkShaderProgram(GLuint vertexShader, GLuint fragmentShader);

// A fragment program specialised by #define keywords. Variants are compiled on first
// request and cached by keyword set; switching to a cached variant does not recompile.
class Material
{
public:
    Material(GLuint vertexShader, std::string versionHeader, std::string fragmentBody,
             std::string name);

    void setKeywords(const std::vector<std::string>& keywords);

    const ShaderProgram& active() const;

    bool hasActive() const
    {
        return m_active != nullptr;
    }
    size_t variantCount() const
    {
        return m_programs.size();
    }

private:
    GLuint m_vertexShader;
    std::string m_versionHeader;
    std::string m_fragmentBody;
    std::string m_name;

    std::map<std::string, std::unique_ptr<ShaderProgram>> m_programs;
    const ShaderProgram* m_active{nullptr};
};

// All programs the solver and compositor draw with, built from the shader directory.
class ShaderLibrary
{
public:
    ShaderLibrary(const std::filesystem::path& shaderDir, ContextApi api,
                  bool supportLinearFiltering);
    ~ShaderLibrary();

    ShaderLibrary(const ShaderLibrary&) = delete;
    ShaderLibrary& operator=(const ShaderLibrary&) = delete;

    const ShaderProgram& copy() const
    {
        return *m_copy;
    }
    const ShaderProgram& clear() const
    {
        return *m_clear;
    }
    const ShaderProgram& splat() const
    {
        return *m_splat;
    }
    const ShaderProgram& divergence() const
    {
        return *m_divergence;
    }
    const ShaderProgram& curl() const
    {
        return *m_curl;
    }
    const ShaderProgram& vorticity() const
    {
        return *m_vorticity;
    }
    const ShaderProgram& pressure() const
    {
        return *m_pressure;
    }
    const ShaderProgram& gradientSubtract() const
    {
        return *m_gradientSubtract;
    }
    const Material& advection() const
    {
        return *m_advection;
    }
    Material& display()
    {
        return *m_display;
    }

private:
    std::unique_ptr<ShaderProgram> buildProgram_(const std::string& fileName);

    std::filesystem::path m_shaderDir;
    std::string m_versionHeader;
    GLuint m_vertexShader{0};

    std::unique_ptr<ShaderProgram> m_copy;
    std::unique_ptr<ShaderProgram> m_clear;
    std::unique_ptr<ShaderProgram> m_splat;
    std::unique_ptr<ShaderProgram> m_divergence;
    std::unique_ptr<ShaderProgram> m_curl;
    std::unique_ptr<ShaderProgram> m_vorticity;
    std::unique_ptr<ShaderProgram> m_pressure;
    std::unique_ptr<ShaderProgram> m_gradientSubtract;
    std::unique_ptr<Material> m_advection;
    std::unique_ptr<Material> m_display;
};

}
