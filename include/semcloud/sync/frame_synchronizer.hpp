#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <opencv2/core.hpp>
#include <pcl/point_cloud.h>
#include <pcl/point_types.h>

#include "semcloud/utils/common_types.hpp"

namespace semcloud {
namespace sync {

/**
 * @brief Decoded camera image with its capture time
 */
struct ImageEvent {
    cv::Mat image;          // BGR8
    double stamp{0.0};      // [s]
};

/**
 * @brief Decoded point scan with its capture time
 */
struct ScanEvent {
    pcl::PointCloud<pcl::PointXYZ>::ConstPtr points;
    double stamp{0.0};      // [s]
};

/**
 * @brief Image/scan pair handed to frame processing
 */
struct Frame {
    cv::Mat image;
    pcl::PointCloud<pcl::PointXYZ>::ConstPtr points;
    double stamp{0.0};          // Image capture time
    double scan_stamp{0.0};
};

/**
 * @brief Pairs image and scan events whose stamps lie within a slop window
 *
 * Each stream has a single pending slot; a newer arrival replaces the
 * pending one. When both slots are full and the stamps differ by at most
 * slop the pair is emitted and both slots clear, otherwise the older event
 * is dropped since it can no longer match anything later.
 *
 * At most one pair is in flight. Events arriving while the callback runs
 * only refresh the slots; pairing resumes once the callback returns.
 */
class FrameSynchronizer {
public:
    using FrameCallback = std::function<void(const Frame&)>;

    struct Config {
        double slop{0.3};       // Maximum stamp difference [s]
    };

    struct Stats {
        utils::AtomicCounter pairs_emitted;
        utils::AtomicCounter images_dropped;
        utils::AtomicCounter scans_dropped;
    };

    /**
     * @throws ConfigurationError if slop is negative
     */
    explicit FrameSynchronizer(const Config& config = Config());

    void setCallback(FrameCallback callback);

    void addImage(ImageEvent event);
    void addScan(ScanEvent event);

    /// True while the callback is running
    bool isBusy() const;

    const Stats& getStats() const { return stats_; }
    const Config& getConfig() const { return config_; }

private:
    /**
     * @brief Resolve pending slots and run the callback for each emitted pair
     *
     * Called with lock held; releases it around the callback.
     */
    void drain(std::unique_lock<std::mutex>& lock);

    /**
     * @brief Apply the pairing rule to the current slots
     * @return Pair to emit, if any
     */
    std::optional<Frame> tryPair();

    Config config_;
    FrameCallback callback_;

    mutable std::mutex mutex_;
    std::optional<ImageEvent> pending_image_;
    std::optional<ScanEvent> pending_scan_;
    bool busy_{false};

    Stats stats_;
};

} // namespace sync
} // namespace semcloud
