#include "GLLoader.hpp"
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <iostream>

namespace Plume
{
namespace GL
{

PFNGLACTIVETEXTUREPROC glActiveTexture = nullptr;
PFNGLGETSTRINGIPROC glGetStringi = nullptr;

PFNGLGENFRAMEBUFFERSPROC glGenFramebuffers = nullptr;
PFNGLBINDFRAMEBUFFERPROC glBindFramebuffer = nullptr;
PFNGLFRAMEBUFFERTEXTURE2DPROC glFramebufferTexture2D = nullptr;
PFNGLCHECKFRAMEBUFFERSTATUSPROC glCheckFramebufferStatus = nullptr;
PFNGLDELETEFRAMEBUFFERSPROC glDeleteFramebuffers = nullptr;

PFNGLCREATESHADERPROC glCreateShader = nullptr;
PFNGLSHADERSOURCEPROC glShaderSource = nullptr;
PFNGLCOMPILESHADERPROC glCompileShader = nullptr;
PFNGLGETSHADERIVPROC glGetShaderiv = nullptr;
PFNGLGETSHADERINFOLOGPROC glGetShaderInfoLog = nullptr;
PFNGLDELETESHADERPROC glDeleteShader = nullptr;

PFNGLCREATEPROGRAMPROC glCreateProgram = nullptr;
PFNGLATTACHSHADERPROC glAttachShader = nullptr;
PFNGLLINKPROGRAMPROC glLinkProgram = nullptr;
PFNGLGETPROGRAMIVPROC glGetProgramiv = nullptr;
PFNGLGETPROGRAMINFOLOGPROC glGetProgramInfoLog = nullptr;
PFNGLDELETEPROGRAMPROC glDeleteProgram = nullptr;
PFNGLUSEPROGRAMPROC glUseProgram = nullptr;

PFNGLGETUNIFORMLOCATIONPROC glGetUniformLocation = nullptr;
PFNGLUNIFORM1IPROC glUniform1i = nullptr;
PFNGLUNIFORM1FPROC glUniform1f = nullptr;
PFNGLUNIFORM2FPROC glUniform2f = nullptr;
PFNGLUNIFORM3FPROC glUniform3f = nullptr;

PFNGLGENVERTEXARRAYSPROC glGenVertexArrays = nullptr;
PFNGLBINDVERTEXARRAYPROC glBindVertexArray = nullptr;
PFNGLDELETEVERTEXARRAYSPROC glDeleteVertexArrays = nullptr;
PFNGLGENBUFFERSPROC glGenBuffers = nullptr;
PFNGLBINDBUFFERPROC glBindBuffer = nullptr;
PFNGLBUFFERDATAPROC glBufferData = nullptr;
PFNGLDELETEBUFFERSPROC glDeleteBuffers = nullptr;
PFNGLVERTEXATTRIBPOINTERPROC glVertexAttribPointer = nullptr;
PFNGLENABLEVERTEXATTRIBARRAYPROC glEnableVertexAttribArray = nullptr;

namespace
{

template <typename Proc> bool load(Proc& target, const char* name)
{
    target = reinterpret_cast<Proc>(glfwGetProcAddress(name));
    if (!target)
    {
        std::cerr << "GLLoader: missing entry point " << name << std::endl;
        return false;
    }
    return true;
}

}

bool loadGLFunctions()
{
    bool ok = true;

    ok &= load(glActiveTexture, "glActiveTexture");
    ok &= load(glGetStringi, "glGetStringi");

    ok &= load(glGenFramebuffers, "glGenFramebuffers");
    ok &= load(glBindFramebuffer, "glBindFramebuffer");
    ok &= load(glFramebufferTexture2D, "glFramebufferTexture2D");
    ok &= load(glCheckFramebufferStatus, "glCheckFramebufferStatus");
    ok &= load(glDeleteFramebuffers, "glDeleteFramebuffers");

    ok &= load(glCreateShader, "glCreateShader");
    ok &= load(glShaderSource, "glShaderSource");
    ok &= load(glCompileShader, "glCompileShader");
    ok &= load(glGetShaderiv, "glGetShaderiv");
    ok &= load(glGetShaderInfoLog, "glGetShaderInfoLog");
    ok &= load(glDeleteShader, "glDeleteShader");

    ok &= load(glCreateProgram, "glCreateProgram");
    ok &= load(glAttachShader, "glAttachShader");
    ok &= load(glLinkProgram, "glLinkProgram");
    ok &= load(glGetProgramiv, "glGetProgramiv");
    ok &= load(glGetProgramInfoLog, "glGetProgramInfoLog");
    ok &= load(glDeleteProgram, "glDeleteProgram");
    ok &= load(glUseProgram, "glUseProgram");

    ok &= load(glGetUniformLocation, "glGetUniformLocation");
    ok &= load(glUniform1i, "glUniform1i");
    ok &= load(glUniform1f, "glUniform1f");
    ok &= load(glUniform2f, "glUniform2f");
    ok &= load(glUniform3f, "glUniform3f");

    ok &= load(glGenVertexArrays, "glGenVertexArrays");
    ok &= load(glBindVertexArray, "glBindVertexArray");
    ok &= load(glDeleteVertexArrays, "glDeleteVertexArrays");
    ok &= load(glGenBuffers, "glGenBuffers");
    ok &= load(glBindBuffer, "glBindBuffer");
    ok &= load(glBufferData, "glBufferData");
    ok &= load(glDeleteBuffers, "glDeleteBuffers");
    ok &= load(glVertexAttribPointer, "glVertexAttribPointer");
    ok &= load(glEnableVertexAttribArray, "glEnableVertexAttribArray");

    return ok;
}

}
}
