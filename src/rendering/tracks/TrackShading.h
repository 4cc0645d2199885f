#ifndef TRACK_SHADING_H
#define TRACK_SHADING_H

#include <optional>

namespace tracks
{

/// Depth distance from the current depth at which vertices shrink to zero size. In interactive
/// mode, vertices farther than this from the current depth are hidden.
inline constexpr float sk_maxDepthDistance = 3.0f;

/// Depth cutoff radius used when there is no current depth
inline constexpr float sk_unboundedDepthDistance = 1.0e10f;

/// Alpha assigned to hidden vertices just past the current time. Being strongly negative, it
/// drives the interpolated alpha of any fragment near such a vertex below zero, so that the
/// fragment is discarded instead of being blended.
inline constexpr float sk_discardAlpha = -100.0f;

/// Width of the band past the current time in which hidden vertices get \c sk_discardAlpha
inline constexpr float sk_discardBandWidth = 1.0f;

/**
 * @brief Parameters of the temporal visibility computation that are shared by all vertices
 */
struct TrackShadingParams
{
    float currentTime = 0.0f;

    /// Depth of the current slicing plane. When not set, depth neither culls nor shrinks vertices.
    std::optional<float> currentDepth = 0.0f;

    /// Extent of the visible window into the past
    float tailLength = 30.0f;

    /// Extent of the visible window into the future
    float headLength = 0.0f;

    /// Fade vertices linearly across the window. When off, every vertex is fully opaque.
    bool useFade = true;

    /// Hide vertices far from the current depth
    bool interactive = false;
};

/**
 * @brief Radius around the current depth within which vertices are not culled
 * @return \c sk_maxDepthDistance if the current depth is set; \c sk_unboundedDepthDistance otherwise
 */
float depthCutoffRadius( const std::optional<float>& currentDepth );

/**
 * @brief Compute the factor by which the rendered size of a vertex is scaled, based on its
 * distance from the current depth. Ranges from 1 (on the plane) to 0 (at or beyond
 * \c sk_maxDepthDistance). Equals 1 when there is no current depth.
 */
float computeVertexSizeFactor( float vertexDepth, const TrackShadingParams& params );

/**
 * @brief Compute the opacity of a track vertex.
 *
 * Vertices ahead of the head of the window (or, in interactive mode, too far from the current
 * depth) are hidden: their alpha is \c sk_discardAlpha if they lie within \c sk_discardBandWidth
 * of the current time and exactly zero otherwise. Remaining vertices fade linearly from
 * alpha 1 at <tt>currentTime + headLength</tt> to alpha 0 at <tt>currentTime - tailLength</tt>.
 * A window of zero total length gives full opacity. Disabling fading makes every vertex opaque.
 *
 * @param[in] vertexTime Time of the vertex
 * @param[in] vertexDepth Depth of the vertex
 * @param[in] params Shading parameters
 * @return Vertex alpha, which is either \c sk_discardAlpha or in [0, 1]
 */
float computeVertexAlpha( float vertexTime, float vertexDepth, const TrackShadingParams& params );

/**
 * @brief Shade a fragment of a track line from its interpolated vertex alpha and size
 * @param[in] alpha Interpolated vertex alpha
 * @param[in] size Interpolated vertex size
 * @param[in] fragmentAlpha Alpha of the fragment color before track shading
 * @return Final fragment alpha in [0, 1], or nullopt if the fragment is discarded
 */
std::optional<float> shadeFragment( float alpha, float size, float fragmentAlpha );

} // namespace tracks

#endif // TRACK_SHADING_H
