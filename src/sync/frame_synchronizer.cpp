#include "semcloud/sync/frame_synchronizer.hpp"

#include <cmath>
#include <utility>

#include "semcloud/utils/errors.hpp"

namespace semcloud {
namespace sync {

FrameSynchronizer::FrameSynchronizer(const Config& config)
    : config_(config) {
    if (!(config_.slop >= 0.0)) {
        throw ConfigurationError("Synchronization slop must be non-negative");
    }
}

void FrameSynchronizer::setCallback(FrameCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

void FrameSynchronizer::addImage(ImageEvent event) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (pending_image_) {
        stats_.images_dropped++;
    }
    pending_image_ = std::move(event);
    drain(lock);
}

void FrameSynchronizer::addScan(ScanEvent event) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (pending_scan_) {
        stats_.scans_dropped++;
    }
    pending_scan_ = std::move(event);
    drain(lock);
}

bool FrameSynchronizer::isBusy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

void FrameSynchronizer::drain(std::unique_lock<std::mutex>& lock) {
    // The thread running the callback picks up pairs completed meanwhile
    if (busy_) {
        return;
    }

    while (auto frame = tryPair()) {
        busy_ = true;
        FrameCallback callback = callback_;
        lock.unlock();

        try {
            if (callback) {
                callback(*frame);
            }
        } catch (...) {
            lock.lock();
            busy_ = false;
            throw;
        }

        lock.lock();
        busy_ = false;
    }
}

std::optional<Frame> FrameSynchronizer::tryPair() {
    while (pending_image_ && pending_scan_) {
        const double dt = pending_image_->stamp - pending_scan_->stamp;

        if (std::abs(dt) <= config_.slop) {
            Frame frame;
            frame.image = std::move(pending_image_->image);
            frame.points = std::move(pending_scan_->points);
            frame.stamp = pending_image_->stamp;
            frame.scan_stamp = pending_scan_->stamp;

            pending_image_.reset();
            pending_scan_.reset();
            stats_.pairs_emitted++;
            return frame;
        }

        if (dt < 0.0) {
            pending_image_.reset();
            stats_.images_dropped++;
        } else {
            pending_scan_.reset();
            stats_.scans_dropped++;
        }
    }
    return std::nullopt;
}

} // namespace sync
} // namespace semcloud
