#include "logic/app/VisibilityReport.h"

#include "logic/tracks/TrackGroup.h"
#include "logic/tracks/TrackLineData.h"
#include "rendering/tracks/TrackFilter.h"

#include <gtest/gtest.h>

namespace
{

TrackLineData makeLineData()
{
  TrackGroup group;
  group.add({0, 0, 0}, 5.0f, 0);   // faded out at the end of the tail
  group.add({0, 0, 0}, 8.5f, 0);   // half faded
  group.add({0, 0, 0}, 10.0f, 0);  // now
  group.add({0, 0, 0}, 11.0f, 0);  // hidden just past now
  group.add({0, 0, 0}, 13.0f, 0);  // hidden in the future
  group.add({0, 0, 4}, 10.0f, 1);  // now, but far from the current depth
  return buildTrackLineData(group);
}

TrackFilter makeFilter()
{
  tracks::TrackShadingParams params;
  params.currentTime = 10.0f;
  params.currentDepth = 0.0f;
  params.tailLength = 5.0f;
  params.headLength = 0.0f;
  return TrackFilter(params);
}

} // namespace

TEST(VisibilityReport, SummarizesDrawnAndDiscardedVertices)
{
  const TrackLineData data = makeLineData();
  TrackFilter filter = makeFilter();

  VisibilitySummary summary = summarizeVisibility(data, filter);
  EXPECT_EQ(6u, summary.numVertices);
  EXPECT_EQ(2u, summary.numVisible);
  EXPECT_EQ(1u, summary.numDiscarded);

  filter.setInteractive(true);
  summary = summarizeVisibility(data, filter);
  EXPECT_EQ(2u, summary.numVisible);
  EXPECT_EQ(2u, summary.numDiscarded);

  filter.setUseFade(false);
  filter.setCurrentDepth(std::nullopt);
  summary = summarizeVisibility(data, filter);
  EXPECT_EQ(6u, summary.numVisible);
  EXPECT_EQ(0u, summary.numDiscarded);
}

TEST(VisibilityReport, TableHasOneRowPerVertex)
{
  const TrackLineData data = makeLineData();
  const std::string report = createVisibilityReport(data, makeFilter());

  std::size_t numLines = 0;
  for (char c : report)
  {
    numLines += ('\n' == c) ? 1 : 0;
  }

  // Settings line, header line, and one line per vertex; the summary ends without a newline
  EXPECT_EQ(2u + data.numVertices(), numLines);
  EXPECT_NE(std::string::npos, report.find("time 10, depth 0, tail 5, head 0"));
  EXPECT_NE(std::string::npos, report.find("2 of 6 vertices drawn (1 discarded near the current time)"));
}

TEST(VisibilityReport, EmptyTracks)
{
  const TrackLineData data = buildTrackLineData(TrackGroup{});
  const VisibilitySummary summary = summarizeVisibility(data, makeFilter());

  EXPECT_EQ(0u, summary.numVertices);
  EXPECT_NE(std::string::npos, createVisibilityReport(data, makeFilter()).find("0 of 0 vertices drawn"));
}
