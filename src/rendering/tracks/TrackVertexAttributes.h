#ifndef TRACK_VERTEX_ATTRIBUTES_H
#define TRACK_VERTEX_ATTRIBUTES_H

#include <cstddef>
#include <optional>
#include <vector>

/**
 * @brief Per-vertex time and depth of a track polyline. Both arrays always match the
 * number of polyline vertices one-to-one.
 */
class TrackVertexAttributes
{
public:

    TrackVertexAttributes() = default;

    /**
     * @brief Set the vertex times and depths of a polyline
     * @param[in] vertexTime Time of each vertex
     * @param[in] vertexDepth Depth of each vertex
     * @param[in] vertexCount Number of vertices in the polyline
     * @throws Exception if either array does not have exactly \c vertexCount elements
     */
    void set( std::vector<float> vertexTime, std::vector<float> vertexDepth, std::size_t vertexCount );

    void clear();

    const std::vector<float>& vertexTime() const { return m_vertexTime; }
    const std::vector<float>& vertexDepth() const { return m_vertexDepth; }

    std::size_t size() const { return m_vertexTime.size(); }
    bool empty() const { return m_vertexTime.empty(); }

    /// Largest vertex time, or nullopt if there are no vertices
    std::optional<float> maxTime() const;

private:

    std::vector<float> m_vertexTime;
    std::vector<float> m_vertexDepth;
};

#endif // TRACK_VERTEX_ATTRIBUTES_H
