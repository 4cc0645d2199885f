#include "logic/app/VisibilityReport.h"

#include "logic/tracks/TrackLineData.h"
#include "rendering/tracks/TrackFilter.h"
#include "rendering/tracks/TrackShading.h"

#include <spdlog/fmt/fmt.h>

#include <sstream>

VisibilitySummary summarizeVisibility(const TrackLineData& data, const TrackFilter& filter)
{
  const auto alphas = filter.computeAlphas(data.m_attributes);
  const auto sizes = filter.computeSizeFactors(data.m_attributes);

  VisibilitySummary summary;
  summary.numVertices = alphas.size();

  for (std::size_t i = 0; i < alphas.size(); ++i)
  {
    if (tracks::shadeFragment(alphas[i], sizes[i], 1.0f))
    {
      ++summary.numVisible;
    }
    else if (tracks::sk_discardAlpha == alphas[i])
    {
      ++summary.numDiscarded;
    }
  }

  return summary;
}

std::string createVisibilityReport(const TrackLineData& data, const TrackFilter& filter)
{
  const auto alphas = filter.computeAlphas(data.m_attributes);
  const auto sizes = filter.computeSizeFactors(data.m_attributes);
  const auto& times = data.m_attributes.vertexTime();
  const auto& depths = data.m_attributes.vertexDepth();
  const auto& params = filter.params();

  std::ostringstream ss;

  ss << fmt::format("time {}, depth {}, tail {}, head {}, fade {}, interactive {}\n",
                    params.currentTime,
                    params.currentDepth ? fmt::format("{}", *params.currentDepth) : std::string("none"),
                    params.tailLength, params.headLength,
                    params.useFade ? "on" : "off", params.interactive ? "on" : "off");

  ss << fmt::format("{:>8} {:>10} {:>10} {:>10} {:>8} {:>8}\n",
                    "track", "t", "depth", "alpha", "size", "drawn");

  for (std::size_t i = 0; i < alphas.size(); ++i)
  {
    const bool drawn = tracks::shadeFragment(alphas[i], sizes[i], 1.0f).has_value();

    ss << fmt::format("{:>8} {:>10.2f} {:>10.2f} {:>10.3f} {:>8.3f} {:>8}\n",
                      data.m_trackIds[i], times[i], depths[i], alphas[i], sizes[i],
                      drawn ? "yes" : "no");
  }

  const VisibilitySummary summary = summarizeVisibility(data, filter);

  ss << fmt::format("{} of {} vertices drawn ({} discarded near the current time)",
                    summary.numVisible, summary.numVertices, summary.numDiscarded);

  return ss.str();
}
