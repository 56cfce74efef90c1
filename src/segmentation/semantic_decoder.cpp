#include "semcloud/segmentation/semantic_decoder.hpp"

#include <stdexcept>
#include <utility>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace semcloud {
namespace segmentation {

SemanticDecoder::SemanticDecoder(ColorMap color_map)
    : color_map_(std::move(color_map)) {
    // Store BGR so rows can be written directly into cv::Mat pixels
    bgr_table_.reserve(color_map_.size());
    for (const auto& rgb : color_map_.colors()) {
        bgr_table_.emplace_back(rgb[2], rgb[1], rgb[0]);
    }
}

void SemanticDecoder::decode(const cv::Mat& labels, cv::Mat& output) const {
    if (labels.type() != CV_32SC1) {
        throw std::invalid_argument("SemanticDecoder expects a CV_32SC1 label image");
    }

    output.create(labels.size(), CV_8UC3);
    const int table_size = static_cast<int>(bgr_table_.size());

    tbb::parallel_for(tbb::blocked_range<int>(0, labels.rows),
        [&](const tbb::blocked_range<int>& range) {
            for (int v = range.begin(); v != range.end(); ++v) {
                const int* src = labels.ptr<int>(v);
                cv::Vec3b* dst = output.ptr<cv::Vec3b>(v);
                for (int u = 0; u < labels.cols; ++u) {
                    const int id = src[u];
                    dst[u] = (id >= 0 && id < table_size) ? bgr_table_[id] : cv::Vec3b(0, 0, 0);
                }
            }
        });
}

} // namespace segmentation
} // namespace semcloud
