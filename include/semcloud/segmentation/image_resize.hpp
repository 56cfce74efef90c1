#pragma once

#include <opencv2/core.hpp>

namespace semcloud {
namespace segmentation {

/**
 * @brief Anti-aliased resize for continuous data (images, confidences)
 *
 * Each down-scaled axis is pre-smoothed with a Gaussian of
 * sigma = (scale - 1) / 2 before bilinear resampling. The result is CV_32F
 * with the channel count of src, values are not rescaled.
 */
void resizeSmooth(const cv::Mat& src, cv::Mat& dst, const cv::Size& size);

/**
 * @brief Nearest-neighbor resize for discrete label images
 *
 * Every output value is copied from some input pixel.
 */
void resizeNearest(const cv::Mat& src, cv::Mat& dst, const cv::Size& size);

} // namespace segmentation
} // namespace semcloud
