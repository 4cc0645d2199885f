#ifndef IMAGE_SLICE_DATA_H
#define IMAGE_SLICE_DATA_H

#include <itkImage.h>

#include <uuid.h>

#include <array>
#include <cstdint>
#include <optional>
#include <vector>


/**
 * @brief Contents of one slice of an image layer: the image displayed in the slice and the
 * source used to create the slice thumbnail.
 *
 * Either image may be the output of a lazily evaluated ITK pipeline (for example, a reader
 * that has not yet run). Call \c load to compute such images and hold them in memory.
 */
class ImageSliceData
{
public:

    using ImageType = itk::Image<float, 3>;

    /// Range of indices along one image axis: [start, stop) with the given step
    struct IndexRange
    {
        int64_t start = 0;
        int64_t stop = 0;
        int64_t step = 1;
    };

    /// Indices of the slice along each axis. An empty range means the whole axis.
    using SliceIndices = std::vector< std::optional<IndexRange> >;

    /// Axis order of a transpose
    using AxisOrder = std::array<unsigned int, 3>;

    /**
     * @brief Construct the slice data
     * @param[in] layerUid UID of the layer that contains the data
     * @param[in] indices Indices of the slice
     * @param[in] image Image displayed in the slice
     * @param[in] thumbnailSource Source of the slice thumbnail (may be null)
     * @throws Exception if the image is null
     */
    ImageSliceData( const uuids::uuid& layerUid,
                    SliceIndices indices,
                    ImageType::Pointer image,
                    ImageType::Pointer thumbnailSource );

    const uuids::uuid& layerUid() const;
    const SliceIndices& indices() const;

    ImageType::Pointer image() const;
    ImageType::Pointer thumbnailSource() const;

    /// Compute the images if they are outputs of pipelines and hold them in memory,
    /// detached from their pipelines
    void load();

    /// True iff the images are held in memory
    bool isLoaded() const;

    /**
     * @brief Permute the axes of the image and thumbnail source. Output axis i is input axis order[i].
     * @throws Exception if the order is not a permutation of (0, 1, 2)
     */
    void transpose( const AxisOrder& order );

    /// True iff the order is a permutation of (0, 1, 2)
    static bool isPermutation( const AxisOrder& order );


private:

    uuids::uuid m_layerUid;
    SliceIndices m_indices;

    ImageType::Pointer m_image;
    ImageType::Pointer m_thumbnailSource;
};

#endif // IMAGE_SLICE_DATA_H
