#include "rendering/tracks/TrackShading.h"

#include <gtest/gtest.h>

using namespace tracks;

namespace
{

TrackShadingParams windowParams()
{
  TrackShadingParams params;
  params.currentTime = 10.0f;
  params.currentDepth = 0.0f;
  params.tailLength = 5.0f;
  params.headLength = 2.0f;
  params.useFade = true;
  params.interactive = false;
  return params;
}

} // namespace

TEST(TrackShading, FadesLinearlyAcrossWindow)
{
  const TrackShadingParams params = windowParams();

  EXPECT_FLOAT_EQ(1.0f, computeVertexAlpha(12.0f, 0.0f, params));
  EXPECT_FLOAT_EQ(0.0f, computeVertexAlpha(5.0f, 0.0f, params));
  EXPECT_FLOAT_EQ(0.5f, computeVertexAlpha(8.5f, 0.0f, params));
}

TEST(TrackShading, AlphaDecreasesStrictlyIntoThePast)
{
  TrackShadingParams withHead = windowParams();
  TrackShadingParams withoutHead = windowParams();
  withoutHead.headLength = 0.0f;

  for (const TrackShadingParams& params : {withHead, withoutHead})
  {
    const float oldest = params.currentTime - params.tailLength;
    const float newest = params.currentTime + params.headLength;
    constexpr int numSteps = 200;
    const float step = (newest - oldest) / static_cast<float>(numSteps);

    // Walk from the newest time in the open window to the oldest
    float previousAlpha = 1.0f;

    for (int i = 1; i < numSteps; ++i)
    {
      const float vertexTime = newest - static_cast<float>(i) * step;
      const float alpha = computeVertexAlpha(vertexTime, 0.0f, params);

      EXPECT_GT(alpha, 0.0f) << "at time " << vertexTime;
      EXPECT_LT(alpha, 1.0f) << "at time " << vertexTime;
      EXPECT_LT(alpha, previousAlpha) << "at time " << vertexTime;

      previousAlpha = alpha;
    }
  }
}

TEST(TrackShading, ClampsBeyondTail)
{
  const TrackShadingParams params = windowParams();
  EXPECT_FLOAT_EQ(0.0f, computeVertexAlpha(-100.0f, 0.0f, params));
}

TEST(TrackShading, HidesVerticesAheadOfHead)
{
  TrackShadingParams params = windowParams();
  EXPECT_EQ(0.0f, computeVertexAlpha(13.0f, 0.0f, params));

  // Within one time unit of now, hidden vertices get the discard alpha
  params.headLength = 0.0f;
  EXPECT_EQ(sk_discardAlpha, computeVertexAlpha(10.5f, 0.0f, params));
  EXPECT_EQ(sk_discardAlpha, computeVertexAlpha(11.0f, 0.0f, params));
  EXPECT_EQ(0.0f, computeVertexAlpha(11.5f, 0.0f, params));
}

TEST(TrackShading, InteractiveHidesVerticesFarFromDepth)
{
  TrackShadingParams params = windowParams();
  params.interactive = true;

  EXPECT_EQ(sk_discardAlpha, computeVertexAlpha(10.0f, 5.0f, params));
  EXPECT_EQ(sk_discardAlpha, computeVertexAlpha(6.0f, -5.0f, params));
  EXPECT_FLOAT_EQ(1.0f, computeVertexAlpha(12.0f, 3.0f, params));

  params.interactive = false;
  EXPECT_FLOAT_EQ(1.0f, computeVertexAlpha(12.0f, 5.0f, params));
}

TEST(TrackShading, UnsetDepthNeverCulls)
{
  TrackShadingParams params = windowParams();
  params.interactive = true;
  params.currentDepth = std::nullopt;

  EXPECT_FLOAT_EQ(1.0f, computeVertexAlpha(12.0f, 1000.0f, params));
  EXPECT_FLOAT_EQ(1.0f, computeVertexSizeFactor(1000.0f, params));
  EXPECT_EQ(sk_unboundedDepthDistance, depthCutoffRadius(std::nullopt));
  EXPECT_EQ(sk_maxDepthDistance, depthCutoffRadius(0.0f));
}

TEST(TrackShading, DisabledFadeOverridesEverything)
{
  TrackShadingParams params = windowParams();
  params.useFade = false;
  params.interactive = true;

  EXPECT_EQ(1.0f, computeVertexAlpha(13.0f, 0.0f, params));
  EXPECT_EQ(1.0f, computeVertexAlpha(10.0f, 50.0f, params));
  EXPECT_EQ(1.0f, computeVertexAlpha(-50.0f, 0.0f, params));
}

TEST(TrackShading, ZeroWindowGivesFullOpacity)
{
  TrackShadingParams params = windowParams();
  params.tailLength = 0.0f;
  params.headLength = 0.0f;

  EXPECT_EQ(1.0f, computeVertexAlpha(10.0f, 0.0f, params));
  EXPECT_EQ(1.0f, computeVertexAlpha(2.0f, 0.0f, params));
}

TEST(TrackShading, SizeFactorShrinksWithDepthDistance)
{
  TrackShadingParams params = windowParams();
  params.currentDepth = 1.0f;

  EXPECT_FLOAT_EQ(1.0f, computeVertexSizeFactor(1.0f, params));
  EXPECT_FLOAT_EQ(0.5f, computeVertexSizeFactor(2.5f, params));
  EXPECT_FLOAT_EQ(0.5f, computeVertexSizeFactor(-0.5f, params));
  EXPECT_FLOAT_EQ(0.0f, computeVertexSizeFactor(4.0f, params));
  EXPECT_FLOAT_EQ(0.0f, computeVertexSizeFactor(40.0f, params));
}

TEST(TrackShading, FragmentsDiscardedForNonPositiveAlphaOrSize)
{
  EXPECT_FALSE(shadeFragment(0.0f, 1.0f, 1.0f));
  EXPECT_FALSE(shadeFragment(sk_discardAlpha, 1.0f, 1.0f));
  EXPECT_FALSE(shadeFragment(0.5f, 0.0f, 1.0f));

  const auto alpha = shadeFragment(0.5f, 0.2f, 0.8f);
  ASSERT_TRUE(alpha);
  EXPECT_FLOAT_EQ(0.4f, *alpha);

  EXPECT_FLOAT_EQ(1.0f, *shadeFragment(1.0f, 1.0f, 2.0f));
}
