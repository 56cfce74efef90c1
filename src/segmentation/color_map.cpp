#include "semcloud/segmentation/color_map.hpp"

#include <stdexcept>
#include <string>

namespace semcloud {
namespace segmentation {

namespace {

inline int bitAt(int value, int bit) {
    return (value >> bit) & 1;
}

} // namespace

std::vector<cv::Vec3f> ColorMap::normalized() const {
    std::vector<cv::Vec3f> result;
    result.reserve(colors_.size());
    for (const auto& color : colors_) {
        result.emplace_back(color[0] / 255.0f, color[1] / 255.0f, color[2] / 255.0f);
    }
    return result;
}

ColorMap buildColorMap(int num_classes) {
    if (num_classes < 0) {
        throw std::invalid_argument("Color map size must be non-negative, got " +
                                    std::to_string(num_classes));
    }

    std::vector<cv::Vec3b> colors(static_cast<size_t>(num_classes));
    for (int i = 0; i < num_classes; ++i) {
        int r = 0, g = 0, b = 0;
        int c = i;
        for (int j = 0; j < 8; ++j) {
            r |= bitAt(c, 0) << (7 - j);
            g |= bitAt(c, 1) << (7 - j);
            b |= bitAt(c, 2) << (7 - j);
            c >>= 3;
        }
        colors[i] = cv::Vec3b(static_cast<uchar>(r), static_cast<uchar>(g), static_cast<uchar>(b));
    }
    return ColorMap(std::move(colors));
}

} // namespace segmentation
} // namespace semcloud
