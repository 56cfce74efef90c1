#pragma once

#include <opencv2/core.hpp>

namespace semcloud {
namespace segmentation {

/**
 * @brief Interface to an external per-pixel classifier
 *
 * infer() receives a CV_32FC3 image at the model's canonical resolution and
 * returns a CV_32FC(C) probability map of the same size, one channel per raw
 * class. Implementations may throw on inference failure.
 */
class SegmentationModel {
public:
    virtual ~SegmentationModel() = default;

    virtual cv::Mat infer(const cv::Mat& input) = 0;

    /// Number of raw classes in the output distribution
    virtual int numClasses() const = 0;
};

} // namespace segmentation
} // namespace semcloud
