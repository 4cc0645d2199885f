#ifndef GL_SHADER_H
#define GL_SHADER_H

#include "rendering/utility/containers/Uniforms.h"
#include "rendering/utility/gl/GLErrorChecker.h"
#include "rendering/utility/gl/GLShaderType.h"

#include <glad/glad.h>

#include <string>


/**
 * @brief Encapsulates a compiled OpenGL shader object along with
 * the uniforms that it declares.
 */
class GLShader final
{
public:

    /// Compile the shader from source
    /// @throws Exception if compilation fails
    GLShader( std::string name, const ShaderType& type, const char* source );

    GLShader( const GLShader& ) = delete;
    GLShader& operator=( const GLShader& ) = delete;

    ~GLShader();

    GLuint handle() const;
    bool isValid() const;

    void setRegisteredUniforms( Uniforms uniforms );
    const Uniforms& getRegisteredUniforms() const;

    static const std::string& shaderTypeString( const ShaderType& type );


private:

    std::string m_name;
    ShaderType m_type;
    GLuint m_handle;

    GLErrorChecker m_errorChecker;

    Uniforms m_uniforms;

    void compileFromString( const char* source );

    bool checkShaderStatus( GLuint handle ) const;
};

#endif // GL_SHADER_H
