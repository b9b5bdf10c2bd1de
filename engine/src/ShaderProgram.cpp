#include "ShaderProgram.hpp"
#include "Profiling.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace Plume
{

const char* uniformName(Uniform uniform)
{
    switch (uniform)
    {
    case Uniform::TexelSize:
        return "texelSize";
    case Uniform::DyeTexelSize:
        return "dyeTexelSize";
    case Uniform::Texture:
        return "uTexture";
    case Uniform::Target:
        return "uTarget";
    case Uniform::Velocity:
        return "uVelocity";
    case Uniform::Source:
        return "uSource";
    case Uniform::Curl:
        return "uCurl";
    case Uniform::Pressure:
        return "uPressure";
    case Uniform::Divergence:
        return "uDivergence";
    case Uniform::Value:
        return "value";
    case Uniform::AspectRatio:
        return "aspectRatio";
    case Uniform::Color:
        return "color";
    case Uniform::Point:
        return "point";
    case Uniform::Radius:
        return "radius";
    case Uniform::Dt:
        return "dt";
    case Uniform::Dissipation:
        return "dissipation";
    case Uniform::CurlStrength:
        return "curl";
    case Uniform::Count:
        break;
    }
    return "";
}

ShaderProgram::ShaderProgram(GLuint program) : m_program(program)
{
    for (size_t i = 0; i < m_locations.size(); ++i)
    {
        m_locations[i] = GL::glGetUniformLocation(m_program, uniformName(static_cast<Uniform>(i)));
    }
}

ShaderProgram::~ShaderProgram()
{
    if (m_program)
    {
        GL::glDeleteProgram(m_program);
        m_program = 0;
    }
}

void ShaderProgram::bind() const
{
    GL::glUseProgram(m_program);
}

void ShaderProgram::setInt(Uniform uniform, GLint value) const
{
    GL::glUniform1i(location(uniform), value);
}

void ShaderProgram::setFloat(Uniform uniform, float value) const
{
    GL::glUniform1f(location(uniform), value);
}

void ShaderProgram::setVec2(Uniform uniform, float x, float y) const
{
    GL::glUniform2f(location(uniform), x, y);
}

void ShaderProgram::setVec3(Uniform uniform, float x, float y, float z) const
{
    GL::glUniform3f(location(uniform), x, y, z);
}

std::string makeKeywordKey(std::vector<std::string> keywords)
{
    std::sort(keywords.begin(), keywords.end());
    keywords.erase(std::unique(keywords.begin(), keywords.end()), keywords.end());

    std::string key;
    for (const auto& keyword : keywords)
    {
        key += keyword;
        key += ';';
    }
    return key;
}

std::string composeShaderSource(const std::string& versionHeader,
                                const std::vector<std::string>& keywords,
                                const std::string& body)
{
    std::string source = versionHeader;
    for (const auto& keyword : keywords)
    {
        source += "#define " + keyword + "\n";
    }
    source += body;
    return source;
}

std::string readShaderFile(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw std::runtime_error("Failed to open shader file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

GLuint compileShader(GLenum shaderType, const std::string& source, const std::string& shaderName)
{
    const char* src = source.c_str();
    GLuint shader = GL::glCreateShader(shaderType);
    GL::glShaderSource(shader, 1, &src, nullptr);
    GL::glCompileShader(shader);

    GLint success;
    GL::glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success)
    {
        char infoLog[512];
        GL::glGetShaderInfoLog(shader, 512, nullptr, infoLog);
        GL::glDeleteShader(shader);
        throw std::runtime_error(shaderName + " shader compilation failed: " + std::string(infoLog));
    }

    return shader;
}

GLuint linkShaderProgram(GLuint vertexShader, GLuint fragmentShader)
{
    GLuint program = GL::glCreateProgram();
    GL::glAttachShader(program, vertexShader);
    GL::glAttachShader(program, fragmentShader);
    GL::glLinkProgram(program);

    GLint success;
    GL::glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (!success)
    {
        char infoLog[512];
        GL::glGetProgramInfoLog(program, 512, nullptr, infoLog);
        GL::glDeleteProgram(program);
        throw std::runtime_error("Shader program linking failed: " + std::string(infoLog));
    }

    return program;
}

Material::Material(GLuint vertexShader, std::string versionHeader, std::string fragmentBody,
                   std::string name)
    : m_vertexShader(vertexShader), m_versionHeader(std::move(versionHeader)),
      m_fragmentBody(std::move(fragmentBody)), m_name(std::move(name))
{
}

void Material::setKeywords(const std::vector<std::string>& keywords)
{
    const std::string key = makeKeywordKey(keywords);

    auto it = m_programs.find(key);
    if (it == m_programs.end())
    {
        PLUME_PROFILE_SCOPE_NAMED("Material::compileVariant");

        const std::string source = composeShaderSource(m_versionHeader, keywords, m_fragmentBody);
        GLuint fragmentShader = compileShader(GL_FRAGMENT_SHADER, source, m_name);

        GLuint program = 0;
        try
        {
            program = linkShaderProgram(m_vertexShader, fragmentShader);
        }
        catch (const std::exception&)
        {
            GL::glDeleteShader(fragmentShader);
            throw;
        }
        GL::glDeleteShader(fragmentShader);

        it = m_programs.emplace(key, std::make_unique<ShaderProgram>(program)).first;
    }

    m_active = it->second.get();
}

const ShaderProgram& Material::active() const
{
    if (!m_active)
    {
        throw std::logic_error(m_name + ": no keyword variant selected");
    }
    return *m_active;
}

ShaderLibrary::ShaderLibrary(const std::filesystem::path& shaderDir, ContextApi api,
                             bool supportLinearFiltering)
    : m_shaderDir(shaderDir), m_versionHeader(shaderVersionHeader(api))
{
    PLUME_PROFILE_SCOPE();

    m_vertexShader = compileShader(
        GL_VERTEX_SHADER, m_versionHeader + readShaderFile(m_shaderDir / "base.vert"), "Base vertex");

    try
    {
        m_copy = buildProgram_("copy.frag");
        m_clear = buildProgram_("clear.frag");
        m_splat = buildProgram_("splat.frag");
        m_divergence = buildProgram_("divergence.frag");
        m_curl = buildProgram_("curl.frag");
        m_vorticity = buildProgram_("vorticity.frag");
        m_pressure = buildProgram_("pressure.frag");
        m_gradientSubtract = buildProgram_("gradient_subtract.frag");

        m_advection = std::make_unique<Material>(m_vertexShader, m_versionHeader,
                                                 readShaderFile(m_shaderDir / "advection.frag"),
                                                 "Advection");
        std::vector<std::string> advectionKeywords;
        if (!supportLinearFiltering)
        {
            advectionKeywords.push_back("MANUAL_FILTERING");
        }
        m_advection->setKeywords(advectionKeywords);

        m_display = std::make_unique<Material>(m_vertexShader, m_versionHeader,
                                               readShaderFile(m_shaderDir / "display.frag"),
                                               "Display");
    }
    catch (const std::exception&)
    {
        GL::glDeleteShader(m_vertexShader);
        m_vertexShader = 0;
        throw;
    }
}

ShaderLibrary::~ShaderLibrary()
{
    if (m_vertexShader)
    {
        GL::glDeleteShader(m_vertexShader);
        m_vertexShader = 0;
    }
}

std::unique_ptr<ShaderProgram> ShaderLibrary::buildProgram_(const std::string& fileName)
{
    const std::string source = m_versionHeader + readShaderFile(m_shaderDir / fileName);
    GLuint fragmentShader = compileShader(GL_FRAGMENT_SHADER, source, fileName);

    GLuint program = 0;
    try
    {
        program = linkShaderProgram(m_vertexShader, fragmentShader);
    }
    catch (const std::exception&)
    {
        GL::glDeleteShader(fragmentShader);
        throw;
    }
    GL::glDeleteShader(fragmentShader);

    return std::make_unique<ShaderProgram>(program);
}

}
