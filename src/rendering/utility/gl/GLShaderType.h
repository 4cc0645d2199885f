#ifndef GL_SHADER_TYPE_H
#define GL_SHADER_TYPE_H

#include <glad/glad.h>

#include <cstdint>

enum class ShaderType : uint32_t
{
    Vertex = GL_VERTEX_SHADER,
    Geometry = GL_GEOMETRY_SHADER,
    Fragment = GL_FRAGMENT_SHADER
};

#endif // GL_SHADER_TYPE_H
