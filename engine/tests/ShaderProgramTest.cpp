#include "EngineConfig.hpp"
#include "GpuTestSupport.hpp"
#include "ShaderProgram.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace Plume;

TEST(ShaderProgramTest, KeywordKeyIgnoresOrderAndDuplicates)
{
    EXPECT_EQ(makeKeywordKey({"B", "A"}), "A;B;");
    EXPECT_EQ(makeKeywordKey({"A", "B"}), makeKeywordKey({"B", "A"}));
    EXPECT_EQ(makeKeywordKey({"A", "A", "B"}), makeKeywordKey({"A", "B"}));
    EXPECT_EQ(makeKeywordKey({}), "");
}

TEST(ShaderProgramTest, DistinctKeywordSetsHaveDistinctKeys)
{
    EXPECT_NE(makeKeywordKey({"AB"}), makeKeywordKey({"A", "B"}));
    EXPECT_NE(makeKeywordKey({"SHADING"}), makeKeywordKey({}));
    EXPECT_NE(makeKeywordKey({"A"}), makeKeywordKey({"A", "B"}));
}

TEST(ShaderProgramTest, SourceIsHeaderDefinesBody)
{
    const std::string source =
        composeShaderSource("#version 330 core\n", {"SHADING", "MANUAL_FILTERING"}, "void main() {}");
    EXPECT_EQ(source,
              "#version 330 core\n#define SHADING\n#define MANUAL_FILTERING\nvoid main() {}");
}

TEST(ShaderProgramTest, MissingShaderFileThrows)
{
    EXPECT_THROW(readShaderFile(Paths::getShaderDir() / "missing.frag"), std::runtime_error);
}

TEST(ShaderProgramTest, UniformNamesMatchShaders)
{
    EXPECT_STREQ(uniformName(Uniform::Texture), "uTexture");
    EXPECT_STREQ(uniformName(Uniform::CurlStrength), "curl");
    EXPECT_STREQ(uniformName(Uniform::DyeTexelSize), "dyeTexelSize");
}

class ShaderProgramGpuTest : public Testing::GpuTest
{
protected:
    ContextApi api() const
    {
        return m_engine->getContext().version.api;
    }
};

TEST_F(ShaderProgramGpuTest, LibraryBuildsEveryProgram)
{
    ShaderLibrary library(Paths::getShaderDir(), api(), m_capabilities.supportLinearFiltering);

    EXPECT_NE(library.copy().handle(), 0u);
    EXPECT_NE(library.splat().handle(), 0u);
    EXPECT_NE(library.pressure().handle(), 0u);
    EXPECT_TRUE(library.advection().hasActive());
    EXPECT_FALSE(library.display().hasActive());

    EXPECT_NE(library.splat().location(Uniform::Point), -1);
    EXPECT_NE(library.pressure().location(Uniform::Divergence), -1);
    EXPECT_EQ(library.copy().location(Uniform::Point), -1);
}

TEST_F(ShaderProgramGpuTest, ManualFilteringVariantCompiles)
{
    ShaderLibrary library(Paths::getShaderDir(), api(), false);
    EXPECT_TRUE(library.advection().hasActive());
    EXPECT_EQ(library.advection().variantCount(), 1u);
}

TEST_F(ShaderProgramGpuTest, MaterialCachesVariants)
{
    const std::string header = shaderVersionHeader(api());
    const GLuint vertexShader = compileShader(
        GL_VERTEX_SHADER, header + readShaderFile(Paths::getShaderDir() / "base.vert"), "Base");

    {
        Material display(vertexShader, header,
                         readShaderFile(Paths::getShaderDir() / "display.frag"), "Display");
        EXPECT_THROW(display.active(), std::logic_error);

        display.setKeywords({"SHADING"});
        const GLuint shaded = display.active().handle();
        EXPECT_EQ(display.variantCount(), 1u);

        display.setKeywords({});
        EXPECT_EQ(display.variantCount(), 2u);
        EXPECT_NE(display.active().handle(), shaded);

        display.setKeywords({"SHADING", "SHADING"});
        EXPECT_EQ(display.variantCount(), 2u);
        EXPECT_EQ(display.active().handle(), shaded);
    }

    GL::glDeleteShader(vertexShader);
}

TEST_F(ShaderProgramGpuTest, CompileErrorCarriesName)
{
    const std::string source = shaderVersionHeader(api()) + "this is not glsl";
    try
    {
        compileShader(GL_FRAGMENT_SHADER, source, "Broken");
        FAIL() << "compileShader accepted invalid source";
    }
    catch (const std::runtime_error& e)
    {
        EXPECT_NE(std::string(e.what()).find("Broken"), std::string::npos);
    }
}
