#include "image/ImageSliceData.h"

#include "common/Exception.hpp"
#include "common/UuidUtility.h"

#include <gtest/gtest.h>

#include <itkCastImageFilter.h>
#include <itkImageRegionIteratorWithIndex.h>

#include <vector>

using ImageType = ImageSliceData::ImageType;

namespace
{

/// Image of size 2 x 3 x 4 whose pixel values encode their index
ImageType::Pointer makeImage()
{
  ImageType::SizeType size;
  size[0] = 2;
  size[1] = 3;
  size[2] = 4;

  ImageType::RegionType region;
  region.SetSize(size);

  auto image = ImageType::New();
  image->SetRegions(region);
  image->Allocate();

  itk::ImageRegionIteratorWithIndex<ImageType> it(image, region);
  for (it.GoToBegin(); !it.IsAtEnd(); ++it)
  {
    const auto index = it.GetIndex();
    it.Set(static_cast<float>(100 * index[0] + 10 * index[1] + index[2]));
  }

  return image;
}

class ImageSliceDataTest : public ::testing::Test
{
protected:
  using CastFilterType = itk::CastImageFilter<ImageType, ImageType>;

  /// Output of a pipeline that has not run yet. The fixture keeps the pipeline alive.
  ImageType::Pointer makeLazyImage()
  {
    auto filter = CastFilterType::New();
    filter->SetInput(makeImage());
    m_filters.push_back(filter);
    return filter->GetOutput();
  }

  std::vector<CastFilterType::Pointer> m_filters;
};

} // namespace

TEST(ImageSliceData, RejectsNullImage)
{
  EXPECT_THROW(ImageSliceData(generateRandomUuid(), {}, nullptr, nullptr), Exception);
}

TEST(ImageSliceData, KeepsLayerAndIndices)
{
  const uuids::uuid uid = generateRandomUuid();

  ImageSliceData::SliceIndices indices{ImageSliceData::IndexRange{1, 2, 1}, std::nullopt, std::nullopt};
  const ImageSliceData data(uid, indices, makeImage(), nullptr);

  EXPECT_EQ(uid, data.layerUid());
  ASSERT_EQ(3u, data.indices().size());
  ASSERT_TRUE(data.indices()[0]);
  EXPECT_EQ(1, data.indices()[0]->start);
  EXPECT_FALSE(data.indices()[1]);
  EXPECT_FALSE(data.thumbnailSource());
  EXPECT_TRUE(data.isLoaded());
}

TEST_F(ImageSliceDataTest, LoadComputesLazyImages)
{
  ImageSliceData data(generateRandomUuid(), {}, makeLazyImage(), makeLazyImage());
  EXPECT_FALSE(data.isLoaded());

  data.load();
  EXPECT_TRUE(data.isLoaded());

  ImageType::IndexType index;
  index[0] = 1;
  index[1] = 2;
  index[2] = 3;
  EXPECT_EQ(123.0f, data.image()->GetPixel(index));
  EXPECT_EQ(123.0f, data.thumbnailSource()->GetPixel(index));

  // Loading again is harmless
  data.load();
  EXPECT_EQ(123.0f, data.image()->GetPixel(index));
}

TEST_F(ImageSliceDataTest, TransposePermutesBothImages)
{
  ImageSliceData data(generateRandomUuid(), {}, makeImage(), makeLazyImage());

  data.transpose({2u, 0u, 1u});

  for (const auto& image : {data.image(), data.thumbnailSource()})
  {
    const auto size = image->GetLargestPossibleRegion().GetSize();
    EXPECT_EQ(4u, size[0]);
    EXPECT_EQ(2u, size[1]);
    EXPECT_EQ(3u, size[2]);

    // Output index (k, i, j) holds input index (i, j, k)
    ImageType::IndexType index;
    index[0] = 3;
    index[1] = 1;
    index[2] = 2;
    EXPECT_EQ(123.0f, image->GetPixel(index));
  }

  EXPECT_TRUE(data.isLoaded());
}

TEST(ImageSliceData, TransposeRejectsNonPermutations)
{
  ImageSliceData data(generateRandomUuid(), {}, makeImage(), nullptr);

  EXPECT_FALSE(ImageSliceData::isPermutation({0u, 0u, 1u}));
  EXPECT_FALSE(ImageSliceData::isPermutation({0u, 1u, 3u}));
  EXPECT_TRUE(ImageSliceData::isPermutation({1u, 2u, 0u}));

  EXPECT_THROW(data.transpose({0u, 1u, 1u}), Exception);
  EXPECT_EQ(2u, data.image()->GetLargestPossibleRegion().GetSize()[0]);
}
