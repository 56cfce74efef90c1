#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include <Eigen/Dense>

#include "semcloud/utils/common_types.hpp"
#include "semcloud/utils/errors.hpp"

namespace semcloud {
namespace core {

/**
 * @brief Camera/scanner calibration snapshot
 *
 * extrinsics maps scan-frame points into the camera frame (4x4 homogeneous).
 * intrinsics is the 3x3 pinhole matrix [[fx,0,cx],[0,fy,cy],[0,0,1]].
 */
struct CalibrationSet {
    Eigen::Matrix4d extrinsics;
    Eigen::Matrix3d intrinsics;

    CalibrationSet() {
        extrinsics.setIdentity();
        intrinsics.setIdentity();
    }

    double fx() const { return intrinsics(0, 0); }
    double fy() const { return intrinsics(1, 1); }
    double cx() const { return intrinsics(0, 2); }
    double cy() const { return intrinsics(1, 2); }
};

/**
 * @brief Thread-safe holder of validated extrinsics and replaceable intrinsics
 *
 * Extrinsics are validated once at construction and never change. Intrinsics
 * are swapped wholesale under an exclusive lock, so a frame that took a
 * snapshot() keeps a consistent matrix even if a calibration event arrives
 * while it is being processed.
 */
class CalibrationStore {
public:
    /// Allowed deviation of det(R) from 1
    static constexpr double kDeterminantTolerance = 1e-5;

    /**
     * @brief Construct and validate
     * @param extrinsics 4x4 scan-to-camera transform
     * @param intrinsics 3x3 pinhole matrix
     * @throws InvalidCalibration if extrinsics fail validation
     */
    CalibrationStore(const Eigen::MatrixXd& extrinsics, const Eigen::Matrix3d& intrinsics);

    CalibrationStore(const CalibrationStore&) = delete;
    CalibrationStore& operator=(const CalibrationStore&) = delete;

    /**
     * @brief Build from a JSON-encoded 4x4 nested array, e.g. "[[1,0,0,0],...]"
     * @throws InvalidCalibration on parse errors, wrong shape or invalid rotation
     */
    static std::unique_ptr<CalibrationStore> fromJson(const std::string& extrinsics_json,
                                                      const Eigen::Matrix3d& intrinsics);

    /**
     * @brief Replace the projection matrix from its four pinhole parameters
     */
    void updateIntrinsics(double fx, double fy, double cx, double cy);

    /**
     * @brief Replace the projection matrix from a row-major 3x3 array
     * @param K nine values as carried by a camera_info message
     * @throws InvalidCalibration if K does not hold exactly nine values
     */
    void updateIntrinsics(const std::vector<double>& K);

    /**
     * @brief Consistent copy of the current calibration
     */
    CalibrationSet snapshot() const;

    const Eigen::Matrix4d& extrinsics() const noexcept { return extrinsics_; }

    Eigen::Matrix3d intrinsics() const;

    int64_t intrinsicsUpdateCount() const { return intrinsics_updates_.get(); }

private:
    void replaceIntrinsics(const Eigen::Matrix3d& K);

    Eigen::Matrix4d extrinsics_;

    mutable std::shared_mutex intrinsics_mutex_;
    std::shared_ptr<const Eigen::Matrix3d> intrinsics_;

    utils::AtomicCounter intrinsics_updates_;
};

namespace calibration_utils {

/**
 * @brief Check that a matrix is a 4x4 transform with a proper rotation block
 * @throws InvalidCalibration describing the first violation found
 */
void validateExtrinsics(const Eigen::MatrixXd& T);

/**
 * @brief Assemble a pinhole matrix
 */
Eigen::Matrix3d makeIntrinsics(double fx, double fy, double cx, double cy);

/**
 * @brief Parse a JSON/YAML nested numeric array into a dense matrix
 * @throws InvalidCalibration if the rows are ragged or non-numeric
 */
Eigen::MatrixXd parseMatrix(const std::string& text);

} // namespace calibration_utils

} // namespace core
} // namespace semcloud
