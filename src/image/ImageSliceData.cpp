#include "image/ImageSliceData.h"

#include "common/Exception.hpp"
#include "common/UuidUtility.h"

#include <itkPermuteAxesImageFilter.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace
{

using ImageType = ImageSliceData::ImageType;

void loadImage( const ImageType::Pointer& image )
{
    if ( ! image || ! image->GetSource() )
    {
        // Null or already in memory
        return;
    }

    image->Update();
    image->DisconnectPipeline();
}

ImageType::Pointer permuteAxes( const ImageType::Pointer& image, const ImageSliceData::AxisOrder& order )
{
    using PermuteFilterType = itk::PermuteAxesImageFilter<ImageType>;

    PermuteFilterType::PermuteOrderArrayType permuteOrder;
    for ( unsigned int i = 0; i < ImageType::ImageDimension; ++i )
    {
        permuteOrder[i] = order[i];
    }

    auto filter = PermuteFilterType::New();
    filter->SetInput( image );
    filter->SetOrder( permuteOrder );
    filter->Update();

    ImageType::Pointer output = filter->GetOutput();
    output->DisconnectPipeline();
    return output;
}

} // anonymous


ImageSliceData::ImageSliceData(
        const uuids::uuid& layerUid,
        SliceIndices indices,
        ImageType::Pointer image,
        ImageType::Pointer thumbnailSource )
    :
    m_layerUid( layerUid ),
    m_indices( std::move( indices ) ),
    m_image( image ),
    m_thumbnailSource( thumbnailSource )
{
    if ( ! m_image )
    {
        throw_debug( "Null image provided to slice data" )
    }
}

const uuids::uuid& ImageSliceData::layerUid() const
{
    return m_layerUid;
}

const ImageSliceData::SliceIndices& ImageSliceData::indices() const
{
    return m_indices;
}

ImageSliceData::ImageType::Pointer ImageSliceData::image() const
{
    return m_image;
}

ImageSliceData::ImageType::Pointer ImageSliceData::thumbnailSource() const
{
    return m_thumbnailSource;
}

void ImageSliceData::load()
{
    try
    {
        loadImage( m_image );
        loadImage( m_thumbnailSource );
    }
    catch ( const itk::ExceptionObject& e )
    {
        spdlog::error( "Exception loading slice data of layer {}: {}", m_layerUid, e.what() );
        throw_debug( std::string( "Unable to load slice data: " ) + e.what() )
    }

    spdlog::debug( "Loaded slice data of layer {}", m_layerUid );
}

bool ImageSliceData::isLoaded() const
{
    return ( ! m_image->GetSource() ) &&
           ( ! m_thumbnailSource || ! m_thumbnailSource->GetSource() );
}

void ImageSliceData::transpose( const AxisOrder& order )
{
    if ( ! isPermutation( order ) )
    {
        spdlog::error( "Invalid transpose order ({}, {}, {}) for slice data of layer {}",
                       order[0], order[1], order[2], m_layerUid );
        throw_debug( "Transpose order is not a permutation of the image axes" )
    }

    m_image = permuteAxes( m_image, order );

    if ( m_thumbnailSource )
    {
        m_thumbnailSource = permuteAxes( m_thumbnailSource, order );
    }
}

bool ImageSliceData::isPermutation( const AxisOrder& order )
{
    AxisOrder sorted = order;
    std::sort( std::begin( sorted ), std::end( sorted ) );
    return ( sorted == AxisOrder{ 0u, 1u, 2u } );
}
