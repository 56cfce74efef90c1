#include "semcloud/core/calibration_store.hpp"

#include <cmath>
#include <mutex>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace semcloud {
namespace core {

CalibrationStore::CalibrationStore(const Eigen::MatrixXd& extrinsics,
                                   const Eigen::Matrix3d& intrinsics) {
    calibration_utils::validateExtrinsics(extrinsics);
    extrinsics_ = extrinsics;
    intrinsics_ = std::make_shared<const Eigen::Matrix3d>(intrinsics);
}

std::unique_ptr<CalibrationStore> CalibrationStore::fromJson(const std::string& extrinsics_json,
                                                             const Eigen::Matrix3d& intrinsics) {
    Eigen::MatrixXd T = calibration_utils::parseMatrix(extrinsics_json);
    return std::make_unique<CalibrationStore>(T, intrinsics);
}

void CalibrationStore::updateIntrinsics(double fx, double fy, double cx, double cy) {
    replaceIntrinsics(calibration_utils::makeIntrinsics(fx, fy, cx, cy));
}

void CalibrationStore::updateIntrinsics(const std::vector<double>& K) {
    if (K.size() != 9) {
        throw InvalidCalibration("Intrinsics must hold 9 values, got " + std::to_string(K.size()));
    }

    Eigen::Matrix3d matrix;
    for (int i = 0; i < 9; ++i) {
        matrix(i / 3, i % 3) = K[i];
    }
    replaceIntrinsics(matrix);
}

CalibrationSet CalibrationStore::snapshot() const {
    CalibrationSet set;
    set.extrinsics = extrinsics_;
    set.intrinsics = intrinsics();
    return set;
}

Eigen::Matrix3d CalibrationStore::intrinsics() const {
    std::shared_lock<std::shared_mutex> lock(intrinsics_mutex_);
    return *intrinsics_;
}

void CalibrationStore::replaceIntrinsics(const Eigen::Matrix3d& K) {
    auto replacement = std::make_shared<const Eigen::Matrix3d>(K);
    {
        std::unique_lock<std::shared_mutex> lock(intrinsics_mutex_);
        intrinsics_.swap(replacement);
    }
    intrinsics_updates_++;
}

namespace calibration_utils {

void validateExtrinsics(const Eigen::MatrixXd& T) {
    if (T.rows() != 4 || T.cols() != 4) {
        std::ostringstream ss;
        ss << "Extrinsics are the wrong shape: " << T.rows() << "x" << T.cols();
        throw InvalidCalibration(ss.str());
    }

    // Check for NaN or infinity
    if (!T.allFinite()) {
        throw InvalidCalibration("Extrinsics contain non-finite values");
    }

    // Determinant 1 rules out reflections and scaled transforms
    const double det = T.block<3, 3>(0, 0).determinant();
    if (std::abs(det - 1.0) > CalibrationStore::kDeterminantTolerance) {
        std::ostringstream ss;
        ss << "Extrinsics do not contain a valid rotation, det = " << det;
        throw InvalidCalibration(ss.str());
    }
}

Eigen::Matrix3d makeIntrinsics(double fx, double fy, double cx, double cy) {
    Eigen::Matrix3d K;
    K << fx,  0.0, cx,
         0.0, fy,  cy,
         0.0, 0.0, 1.0;
    return K;
}

Eigen::MatrixXd parseMatrix(const std::string& text) {
    YAML::Node node;
    try {
        node = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw InvalidCalibration(std::string("Failed to parse matrix: ") + e.what());
    }

    if (!node.IsSequence() || node.size() == 0) {
        throw InvalidCalibration("Matrix must be a non-empty nested array");
    }

    const size_t rows = node.size();
    const size_t cols = node[0].IsSequence() ? node[0].size() : 0;
    if (cols == 0) {
        throw InvalidCalibration("Matrix rows must be non-empty arrays");
    }

    Eigen::MatrixXd matrix(rows, cols);
    try {
        for (size_t i = 0; i < rows; ++i) {
            const YAML::Node row = node[i];
            if (!row.IsSequence() || row.size() != cols) {
                throw InvalidCalibration("Matrix rows have inconsistent lengths");
            }
            for (size_t j = 0; j < cols; ++j) {
                matrix(i, j) = row[j].as<double>();
            }
        }
    } catch (const YAML::Exception& e) {
        throw InvalidCalibration(std::string("Matrix entry is not numeric: ") + e.what());
    }

    return matrix;
}

} // namespace calibration_utils

} // namespace core
} // namespace semcloud
