#ifndef UNIFORMS_H
#define UNIFORMS_H

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include <glad/glad.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>


/// GLSL types of the uniforms used by the track shaders
enum class UniformType : uint32_t
{
    Bool = GL_BOOL,
    Int = GL_INT,
    UInt = GL_UNSIGNED_INT,
    Float = GL_FLOAT,
    Vec2 = GL_FLOAT_VEC2,
    Vec3 = GL_FLOAT_VEC3,
    Vec4 = GL_FLOAT_VEC4,
    Mat4 = GL_FLOAT_MAT4,

    /// Uniform whose location was queried without a declaration. It accepts any value.
    Undefined = 0
};


/**
 * @brief Collection of uniform variables for a GLSL shader program.
 *
 * Setting a value marks the uniform dirty. Dirty uniforms are the ones that still
 * need to be uploaded to the program; see \c GLShaderProgram::applyUniforms.
 */
class Uniforms
{
public:

    using ValueType = std::variant<
        bool,
        int,
        unsigned int,
        float,
        glm::vec2,
        glm::vec3,
        glm::vec4,
        glm::mat4
    >;

    /// Declaration of a single uniform variable
    struct Decl
    {
        Decl();

        /// @throws Exception if the default value does not hold the declared type
        Decl( UniformType type, ValueType defaultValue, bool isRequired );

        Decl( const Decl& ) = default;
        Decl& operator=( const Decl& ) = default;

        Decl( Decl&& ) = default;
        Decl& operator=( Decl&& ) = default;

        ~Decl() = default;

        /// @throws Exception if the value does not hold the declared type
        void set( const ValueType& value );

        UniformType m_type;
        ValueType m_defaultValue;
        ValueType m_value;
        GLint m_location;
        bool m_isRequired;
        bool m_isDirty;
    };


    /// Hash map of uniforms, keyed by uniform name used in the GLSL code.
    using UniformsMap = std::unordered_map< std::string, Decl >;


    explicit Uniforms() = default;
    explicit Uniforms( const UniformsMap& map );

    Uniforms( const Uniforms& ) = default;
    Uniforms& operator=( const Uniforms& ) = default;

    Uniforms( Uniforms&& ) = default;
    Uniforms& operator=( Uniforms&& ) = default;

    ~Uniforms() = default;


    /// Insert a single uniform. Ignores uniforms that already exist.
    bool insertUniform( const std::string& name, const Decl& uniform );

    bool insertUniform( const std::string& name, const UniformType& type,
                        ValueType defaultValue, bool isRequired = true );


    /// Insert another set of uniforms. Ignores uniforms that already exist.
    void insertUniforms( const Uniforms& uniforms );

    void resetAllToDefaults();


    /// @throws std::out_of_range If uniform with given name doesn't exist
    /// @throws Exception If the value does not hold the type of the uniform
    void setValue( const std::string& name, const ValueType& value );
    ValueType value( const std::string& name ) const;

    void setLocation( const std::string& name, GLint loc );
    std::optional<GLint> location( const std::string& name ) const;

    GLint queryAndSetLocation(
            const std::string& name,
            std::function< GLint ( const std::string& ) > locationGetter );

    /// @return False iff a required uniform has no location in the program
    bool queryAndSetAllLocations( std::function< GLint ( const std::string& ) > locationGetter );

    void setDirty( const std::string& name, bool set );
    bool isDirty( const std::string& name ) const;

    /// Names of all uniforms whose values have not yet been applied to a program, sorted
    std::vector< std::string > dirtyUniformNames() const;

    const Decl& operator() ( const std::string& name ) const;
    const UniformsMap& operator() () const;

    bool containsKey( const std::string& name ) const;

    static std::string getUniformTypeString( const GLenum type );

    /// Check that a value holds the C++ type that is uploaded for a uniform type
    static bool holdsType( UniformType type, const ValueType& value );


private:

    UniformsMap m_uniformsMap;
};

#endif // UNIFORMS_H
