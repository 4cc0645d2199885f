#ifndef TRACK_FILTER_H
#define TRACK_FILTER_H

#include "rendering/tracks/TrackShading.h"
#include "rendering/tracks/TrackVertexAttributes.h"
#include "rendering/utility/containers/Uniforms.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>


/**
 * @brief Temporal visibility filter for track lines.
 *
 * Holds the shading parameters of one rendered track visual. Every setter updates the
 * parameters and the corresponding shader uniform values immediately, marking those uniforms
 * dirty. The dirty uniforms are the values that still need to be uploaded to the GPU,
 * which happens separately (see \c GLShaderProgram::applyUniforms).
 */
class TrackFilter
{
public:

    /// A uniform name and the value to upload for it
    using UniformUpload = std::pair< std::string, Uniforms::ValueType >;

    TrackFilter();
    explicit TrackFilter( const tracks::TrackShadingParams& params );

    /// Uniforms declared by the track vertex shader, with default values
    static Uniforms createUniforms();

    void setCurrentTime( float time );

    /**
     * @brief Set the current time to the latest vertex time, so that whole tracks are shown
     * up to their ends
     * @return False iff there are no vertices, in which case the time is unchanged
     */
    bool setCurrentTimeToLatest( const TrackVertexAttributes& attributes );

    /// Set the current depth. Pass nullopt to render without a depth.
    void setCurrentDepth( std::optional<float> depth );

    /// @throws Exception if the length is negative or not finite
    void setTailLength( float length );

    /// @throws Exception if the length is negative or not finite
    void setHeadLength( float length );

    void setUseFade( bool useFade );
    void setInteractive( bool interactive );

    const tracks::TrackShadingParams& params() const;

    const Uniforms& uniforms() const;
    Uniforms& uniforms();

    /// Uniform values changed since they were last uploaded, sorted by name
    std::vector< UniformUpload > pendingUploads() const;

    /// Alpha of each vertex
    std::vector<float> computeAlphas( const TrackVertexAttributes& attributes ) const;

    /// Size factor of each vertex
    std::vector<float> computeSizeFactors( const TrackVertexAttributes& attributes ) const;

private:

    void syncAllUniforms();

    tracks::TrackShadingParams m_params;
    Uniforms m_uniforms;
};

#endif // TRACK_FILTER_H
