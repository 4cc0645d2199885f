#include "rendering/tracks/TrackFilter.h"

#include "common/Exception.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <variant>

namespace
{

void markAllUploaded(TrackFilter& filter)
{
  for (const auto& name : filter.uniforms().dirtyUniformNames())
  {
    filter.uniforms().setDirty(name, false);
  }
}

} // namespace

TEST(TrackFilter, DefaultsAndUniforms)
{
  const TrackFilter filter;

  EXPECT_EQ(0.0f, filter.params().currentTime);
  ASSERT_TRUE(filter.params().currentDepth);
  EXPECT_EQ(0.0f, *filter.params().currentDepth);
  EXPECT_EQ(30.0f, filter.params().tailLength);
  EXPECT_EQ(0.0f, filter.params().headLength);
  EXPECT_TRUE(filter.params().useFade);
  EXPECT_FALSE(filter.params().interactive);

  const Uniforms uniforms = TrackFilter::createUniforms();
  for (const char* name : {"u_currentTime", "u_currentDepth", "u_hasCurrentDepth", "u_tailLength",
                           "u_headLength", "u_useFade", "u_interactive"})
  {
    EXPECT_TRUE(uniforms.containsKey(name)) << name;
  }

  // Nothing has been uploaded yet
  EXPECT_EQ(7u, filter.pendingUploads().size());
}

TEST(TrackFilter, SettersMarkOnlyTouchedUniformsForUpload)
{
  TrackFilter filter;
  markAllUploaded(filter);
  EXPECT_TRUE(filter.pendingUploads().empty());

  filter.setCurrentTime(12.0f);

  auto uploads = filter.pendingUploads();
  ASSERT_EQ(1u, uploads.size());
  EXPECT_EQ("u_currentTime", uploads[0].first);
  EXPECT_EQ(12.0f, std::get<float>(uploads[0].second));
  EXPECT_EQ(12.0f, filter.params().currentTime);

  markAllUploaded(filter);
  filter.setTailLength(4.0f);
  filter.setInteractive(true);

  uploads = filter.pendingUploads();
  ASSERT_EQ(2u, uploads.size());
  EXPECT_EQ("u_interactive", uploads[0].first);
  EXPECT_TRUE(std::get<bool>(uploads[0].second));
  EXPECT_EQ("u_tailLength", uploads[1].first);
  EXPECT_EQ(4.0f, std::get<float>(uploads[1].second));
}

TEST(TrackFilter, ClearingDepthUploadsFlag)
{
  TrackFilter filter;
  markAllUploaded(filter);

  filter.setCurrentDepth(std::nullopt);
  EXPECT_FALSE(filter.params().currentDepth);

  auto uploads = filter.pendingUploads();
  ASSERT_EQ(1u, uploads.size());
  EXPECT_EQ("u_hasCurrentDepth", uploads[0].first);
  EXPECT_FALSE(std::get<bool>(uploads[0].second));

  markAllUploaded(filter);
  filter.setCurrentDepth(2.5f);

  uploads = filter.pendingUploads();
  ASSERT_EQ(2u, uploads.size());
  EXPECT_EQ("u_currentDepth", uploads[0].first);
  EXPECT_EQ(2.5f, std::get<float>(uploads[0].second));
  EXPECT_EQ("u_hasCurrentDepth", uploads[1].first);
  EXPECT_TRUE(std::get<bool>(uploads[1].second));
}

TEST(TrackFilter, RejectsInvalidWindowLengths)
{
  TrackFilter filter;
  markAllUploaded(filter);

  EXPECT_THROW(filter.setTailLength(-1.0f), Exception);
  EXPECT_THROW(filter.setHeadLength(-0.5f), Exception);
  EXPECT_THROW(filter.setHeadLength(std::numeric_limits<float>::quiet_NaN()), Exception);
  EXPECT_THROW(filter.setTailLength(std::numeric_limits<float>::infinity()), Exception);

  EXPECT_EQ(30.0f, filter.params().tailLength);
  EXPECT_EQ(0.0f, filter.params().headLength);
  EXPECT_TRUE(filter.pendingUploads().empty());

  tracks::TrackShadingParams params;
  params.tailLength = -3.0f;
  EXPECT_THROW(TrackFilter{params}, Exception);
}

TEST(TrackFilter, ComputesPerVertexAlphasAndSizes)
{
  tracks::TrackShadingParams params;
  params.currentTime = 10.0f;
  params.currentDepth = 0.0f;
  params.tailLength = 5.0f;
  params.headLength = 2.0f;

  const TrackFilter filter(params);

  TrackVertexAttributes attributes;
  attributes.set({12.0f, 5.0f, 8.5f, 13.0f}, {0.0f, 1.5f, 3.0f, 0.0f}, 4);

  const auto alphas = filter.computeAlphas(attributes);
  ASSERT_EQ(4u, alphas.size());
  EXPECT_FLOAT_EQ(1.0f, alphas[0]);
  EXPECT_FLOAT_EQ(0.0f, alphas[1]);
  EXPECT_FLOAT_EQ(0.5f, alphas[2]);
  EXPECT_EQ(0.0f, alphas[3]);

  const auto sizes = filter.computeSizeFactors(attributes);
  ASSERT_EQ(4u, sizes.size());
  EXPECT_FLOAT_EQ(1.0f, sizes[0]);
  EXPECT_FLOAT_EQ(0.5f, sizes[1]);
  EXPECT_FLOAT_EQ(0.0f, sizes[2]);
}

TEST(TrackFilter, CurrentTimeToLatestVertex)
{
  TrackFilter filter;

  EXPECT_FALSE(filter.setCurrentTimeToLatest(TrackVertexAttributes{}));
  EXPECT_EQ(0.0f, filter.params().currentTime);

  TrackVertexAttributes attributes;
  attributes.set({3.0f, 9.0f, 7.0f}, {0.0f, 0.0f, 0.0f}, 3);

  EXPECT_TRUE(filter.setCurrentTimeToLatest(attributes));
  EXPECT_EQ(9.0f, filter.params().currentTime);
  EXPECT_EQ(9.0f, std::get<float>(filter.uniforms().value("u_currentTime")));
}
