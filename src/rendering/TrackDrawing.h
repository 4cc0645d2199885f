#ifndef TRACK_DRAWING_H
#define TRACK_DRAWING_H

#include "rendering/utility/gl/GLBufferObject.h"
#include "rendering/utility/gl/GLErrorChecker.h"
#include "rendering/utility/gl/GLShaderProgram.h"
#include "rendering/utility/gl/GLVertexArrayObject.h"

#include <glm/mat4x4.hpp>

#include <cstddef>
#include <memory>

class TrackFilter;
struct TrackLineData;


/**
 * @brief Draws the line segments of tracks, shaded by a track filter.
 * All functions must be called with a current OpenGL context.
 */
class TrackDrawing
{
public:

    TrackDrawing();
    ~TrackDrawing() = default;

    TrackDrawing( const TrackDrawing& ) = delete;
    TrackDrawing& operator=( const TrackDrawing& ) = delete;

    /// Compile and link the track shader program
    /// @throws Exception if the program cannot be created
    void initialize();

    /**
     * @brief Upload the vertex attributes and segment indices of the tracks
     * @throws Exception if the number of positions, colors, or vertex attributes differs
     */
    void setLineData( const TrackLineData& data );

    /**
     * @brief Draw the track lines. The dirty filter uniforms are uploaded first.
     * @param[in,out] filter Track filter, whose uniforms are marked clean after upload
     * @param[in] clip_T_world Transformation from track (world) to clip space
     */
    void render( TrackFilter& filter, const glm::mat4& clip_T_world );

    /// Set the line segments' width in pixels
    void setLineWidth( float width );

    std::size_t numSegments() const;


private:

    bool createProgram();

    static constexpr GLuint msk_positionIndex = 0;
    static constexpr GLuint msk_colorIndex = 1;
    static constexpr GLuint msk_vertexTimeIndex = 2;
    static constexpr GLuint msk_vertexDepthIndex = 3;

    std::unique_ptr<GLShaderProgram> m_program;

    GLVertexArrayObject m_vao;
    GLBufferObject m_positionsBuffer;
    GLBufferObject m_colorsBuffer;
    GLBufferObject m_vertexTimeBuffer;
    GLBufferObject m_vertexDepthBuffer;
    GLBufferObject m_indicesBuffer;

    GLVertexArrayObject::IndexedDrawParams m_drawParams;
    float m_lineWidth;

    GLErrorChecker m_errorChecker;
};

#endif // TRACK_DRAWING_H
