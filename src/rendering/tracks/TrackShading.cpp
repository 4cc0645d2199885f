#include "rendering/tracks/TrackShading.h"

#include <glm/common.hpp>

#include <cmath>

namespace tracks
{

float depthCutoffRadius(const std::optional<float>& currentDepth)
{
  return (currentDepth ? sk_maxDepthDistance : sk_unboundedDepthDistance);
}

float computeVertexSizeFactor(float vertexDepth, const TrackShadingParams& params)
{
  if (!params.currentDepth)
  {
    return 1.0f;
  }

  const float sizeFactor = 1.0f - std::abs(*params.currentDepth - vertexDepth) / sk_maxDepthDistance;
  return glm::clamp(sizeFactor, 0.0f, 1.0f);
}

float computeVertexAlpha(float vertexTime, float vertexDepth, const TrackShadingParams& params)
{
  if (!params.useFade)
  {
    return 1.0f;
  }

  const float depthDistance = params.currentDepth ? std::abs(*params.currentDepth - vertexDepth) : 0.0f;

  const bool aheadOfHead = (vertexTime > params.currentTime + params.headLength);
  const bool outOfDepth = params.interactive
                          && (depthDistance > depthCutoffRadius(params.currentDepth));

  if (aheadOfHead || outOfDepth)
  {
    return (vertexTime <= params.currentTime + sk_discardBandWidth) ? sk_discardAlpha : 0.0f;
  }

  const float windowLength = params.tailLength + params.headLength;

  const float fade = (windowLength > 0.0f)
                       ? (params.headLength + params.currentTime - vertexTime) / windowLength
                       : 0.0f;

  return glm::clamp(1.0f - fade, 0.0f, 1.0f);
}

std::optional<float> shadeFragment(float alpha, float size, float fragmentAlpha)
{
  if (alpha <= 0.0f || size <= 0.0f)
  {
    return std::nullopt;
  }

  return glm::clamp(alpha * fragmentAlpha, 0.0f, 1.0f);
}

} // namespace tracks
