#pragma once

#include <stdexcept>
#include <string>

namespace semcloud {

/**
 * @brief Raised at startup when configuration values are missing or inconsistent
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Raised when extrinsic or intrinsic calibration data is malformed
 */
class InvalidCalibration : public std::runtime_error {
public:
    explicit InvalidCalibration(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Raised for per-frame failures such as malformed model output
 *
 * Caught by the pipeline controller, which drops the frame.
 */
class FrameError : public std::runtime_error {
public:
    explicit FrameError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace semcloud
