#pragma once

#include <optional>
#include <vector>
#include <opencv2/core.hpp>

namespace semcloud {
namespace segmentation {

/**
 * @brief Raw model class to application semantic class lookup
 *
 * Raw ids without a defined mapping, including ids outside the table and
 * negative ids, resolve to the background id.
 */
class ClassRemapper {
public:
    using RemapTable = std::vector<std::optional<int>>;

    ClassRemapper(RemapTable table, int background_id);

    /**
     * @brief Map a single raw class id
     */
    int map(int raw_id) const {
        if (raw_id < 0 || raw_id >= static_cast<int>(table_.size()) || !table_[raw_id]) {
            return background_id_;
        }
        return *table_[raw_id];
    }

    /**
     * @brief Remap a CV_32SC1 label image
     * @param labels Raw label image
     * @param output Destination, allocated as CV_32SC1 of the same size (may alias labels)
     */
    void remap(const cv::Mat& labels, cv::Mat& output) const;

    cv::Mat remap(const cv::Mat& labels) const {
        cv::Mat output;
        remap(labels, output);
        return output;
    }

    const RemapTable& table() const { return table_; }
    int backgroundId() const { return background_id_; }

private:
    RemapTable table_;
    int background_id_;
};

} // namespace segmentation
} // namespace semcloud
