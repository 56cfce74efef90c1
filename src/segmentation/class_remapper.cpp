#include "semcloud/segmentation/class_remapper.hpp"

#include <stdexcept>
#include <utility>

namespace semcloud {
namespace segmentation {

ClassRemapper::ClassRemapper(RemapTable table, int background_id)
    : table_(std::move(table)), background_id_(background_id) {}

void ClassRemapper::remap(const cv::Mat& labels, cv::Mat& output) const {
    if (labels.type() != CV_32SC1) {
        throw std::invalid_argument("ClassRemapper expects a CV_32SC1 label image");
    }

    output.create(labels.size(), CV_32SC1);
    for (int v = 0; v < labels.rows; ++v) {
        const int* src = labels.ptr<int>(v);
        int* dst = output.ptr<int>(v);
        for (int u = 0; u < labels.cols; ++u) {
            dst[u] = map(src[u]);
        }
    }
}

} // namespace segmentation
} // namespace semcloud
