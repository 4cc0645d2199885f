#ifndef GL_SHADER_PROGRAM_H
#define GL_SHADER_PROGRAM_H

#include "rendering/utility/containers/Uniforms.h"
#include "rendering/utility/gl/GLShader.h"

#include <glm/fwd.hpp>

#include <glad/glad.h>

#include <memory>
#include <set>
#include <string>


/**
 * @brief Encapsulates an OpenGL shader program: a set of attached shaders
 * that are linked together, plus the uniforms that they declare.
 */
class GLShaderProgram final
{
public:

    explicit GLShaderProgram( std::string name );

    GLShaderProgram( const GLShaderProgram& ) = delete;
    GLShaderProgram& operator=( const GLShaderProgram& ) = delete;

    ~GLShaderProgram();

    const std::string& name() const;

    /// Attach a compiled shader and register its uniforms with the program
    /// @throws Exception if the shader is invalid or the program cannot be created
    void attachShader( std::shared_ptr<GLShader> shader );

    /// Link the program and query the locations of its registered uniforms
    bool link();

    void use();
    void stopUse();

    GLint getUniformLocation( const std::string& name );

    bool setUniform( const std::string& name, const glm::mat4& m );

    /**
     * @brief Upload the dirty uniforms of a container to this program, which must
     * be in use. The uploaded uniforms are marked clean.
     * @param[in,out] uniforms Uniform values to upload
     */
    void applyUniforms( Uniforms& uniforms );

    /// Log the active uniforms and attributes of the linked program at debug level
    void logActiveVariables();


private:

    /// Visitor that uploads a uniform value to a location of the program in use
    class UniformSetter
    {
    public:

        void setLocation( GLint loc );

        void operator()( bool v );
        void operator()( int v );
        void operator()( unsigned int v );
        void operator()( float v );
        void operator()( const glm::vec2& vec );
        void operator()( const glm::vec3& vec );
        void operator()( const glm::vec4& vec );
        void operator()( const glm::mat4& mat );

    private:

        GLint m_loc = -1;
    };

    std::string m_name;
    GLuint m_handle;
    bool m_linked;

    std::set< std::shared_ptr<GLShader> > m_attachedShaders;
    Uniforms m_registeredUniforms;
};

#endif // GL_SHADER_PROGRAM_H
