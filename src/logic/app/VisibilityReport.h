#ifndef VISIBILITY_REPORT_H
#define VISIBILITY_REPORT_H

#include <cstddef>
#include <string>

class TrackFilter;
struct TrackLineData;

/// Summary counts of a visibility report
struct VisibilitySummary
{
    std::size_t numVertices = 0;
    std::size_t numVisible = 0; //!< Vertices with positive alpha and size
    std::size_t numDiscarded = 0; //!< Vertices with the discard alpha
};

/**
 * @brief Evaluate the track filter on the CPU for every vertex and summarize the result
 */
VisibilitySummary summarizeVisibility( const TrackLineData& data, const TrackFilter& filter );

/**
 * @brief Create a table of the per-vertex visibility of tracks. Each row holds the track ID,
 * time, depth, alpha, and size factor of a vertex and whether its fragments are drawn.
 */
std::string createVisibilityReport( const TrackLineData& data, const TrackFilter& filter );

#endif // VISIBILITY_REPORT_H
