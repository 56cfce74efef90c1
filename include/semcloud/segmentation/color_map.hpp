#pragma once

#include <cstddef>
#include <utility>
#include <vector>
#include <opencv2/core.hpp>

namespace semcloud {
namespace segmentation {

/**
 * @brief Immutable class-index to RGB lookup table
 *
 * Entry i is the color assigned to semantic class i. Entries are stored as
 * (R, G, B); use SemanticDecoder to produce BGR images.
 */
class ColorMap {
public:
    ColorMap() = default;
    explicit ColorMap(std::vector<cv::Vec3b> colors) : colors_(std::move(colors)) {}

    size_t size() const { return colors_.size(); }
    bool empty() const { return colors_.empty(); }

    const cv::Vec3b& operator[](size_t index) const { return colors_[index]; }
    const cv::Vec3b& at(size_t index) const { return colors_.at(index); }

    const std::vector<cv::Vec3b>& colors() const { return colors_; }

    /**
     * @brief Same table scaled to floating point [0, 1]
     */
    std::vector<cv::Vec3f> normalized() const;

private:
    std::vector<cv::Vec3b> colors_;
};

/**
 * @brief Build the deterministic N-entry color table
 *
 * The bits of each class index are spread over the three channels, three bits
 * per round, most significant color bit first, so neighboring ids get well
 * separated colors. Index 0 is black.
 *
 * @param num_classes Number of entries
 * @throws std::invalid_argument if num_classes is negative
 */
ColorMap buildColorMap(int num_classes);

} // namespace segmentation
} // namespace semcloud
