#pragma once

#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "semcloud/segmentation/class_remapper.hpp"
#include "semcloud/segmentation/segmentation_adapter.hpp"
#include "semcloud/segmentation/semantic_decoder.hpp"
#include "semcloud/utils/common_types.hpp"

namespace semcloud {
namespace fusion {

/**
 * @brief Product kinds handed to the cloud generator
 */
enum class FusionMode {
    COLOR = 0,              ///< Camera color only, no model call
    SEMANTICS_MAX = 1,      ///< Best class and its confidence per pixel
    SEMANTICS_BAYESIAN = 2  ///< Top-3 classes and confidences per pixel
};

/// Number of hypotheses kept by the Bayesian mode
constexpr int kTopK = 3;

/**
 * @brief Per-frame fusion output, owned by the caller and reused across frames
 *
 * Slot k of semantic_colors (BGR8) and confidences (CV_32FC1) holds rank k.
 * Max mode fills one slot, Bayesian mode exactly kTopK. labels carries the
 * sensor-resolution label map of each slot (remapped in Max mode, raw in
 * Bayesian mode). Every call overwrites all slots; stale content never leaks
 * into the next frame.
 */
struct FusionProducts : public utils::BaseResult {
    std::vector<cv::Mat> semantic_colors;
    std::vector<cv::Mat> confidences;
    std::vector<cv::Mat> labels;

    size_t slotCount() const { return semantic_colors.size(); }

    /// Resize slot vectors, keeping existing allocations
    void resizeSlots(size_t count) {
        semantic_colors.resize(count);
        confidences.resize(count);
        labels.resize(count);
    }

    void clear() override {
        BaseResult::clear();
        semantic_colors.clear();
        confidences.clear();
        labels.clear();
    }
};

/**
 * @brief Abstract base class for fusion strategies
 *
 * One strategy is selected at startup from the configured FusionMode and
 * invoked once per synchronized frame.
 */
class FusionStrategy {
public:
    virtual ~FusionStrategy() = default;

    /**
     * @brief Produce the semantic products for one image
     * @param image BGR8 image at sensor resolution
     * @param products Output, overwritten in place
     */
    virtual void fuse(const cv::Mat& image, FusionProducts& products) = 0;

    virtual FusionMode getMode() const = 0;

    virtual const char* getName() const = 0;

    /// Whether fuse() invokes the segmentation model
    virtual bool requiresModel() const { return true; }
};

/**
 * @brief Collaborators shared by the semantic strategies
 */
struct FusionContext {
    std::shared_ptr<segmentation::SegmentationAdapter> adapter;
    std::shared_ptr<const segmentation::ClassRemapper> remapper;
    std::shared_ptr<const segmentation::SemanticDecoder> decoder;
    cv::Size output_size{0, 0};     // Sensor resolution of all products
};

/**
 * @brief Passthrough: the camera image is the product
 */
class ColorFusion : public FusionStrategy {
public:
    void fuse(const cv::Mat& image, FusionProducts& products) override;
    FusionMode getMode() const override { return FusionMode::COLOR; }
    const char* getName() const override { return "Color"; }
    bool requiresModel() const override { return false; }
};

/**
 * @brief Single best class per pixel
 *
 * Argmax over classes (lowest index wins ties) gives the label, the winning
 * probability the confidence. Labels are remapped, nearest-resized to sensor
 * resolution and decoded; confidence is smoothly resized and clamped to [0, 1].
 */
class MaxConfidenceFusion : public FusionStrategy {
public:
    explicit MaxConfidenceFusion(const FusionContext& context);

    void fuse(const cv::Mat& image, FusionProducts& products) override;
    FusionMode getMode() const override { return FusionMode::SEMANTICS_MAX; }
    const char* getName() const override { return "MaxConfidence"; }

    /// Post-model stage, usable without an adapter
    void fuseProbabilities(const cv::Mat& probabilities, FusionProducts& products) const;

private:
    FusionContext context_;
};

/**
 * @brief Three best classes per pixel, kept as separate hypotheses
 *
 * Ranks are ordered by probability descending, ties by ascending raw index.
 * Raw labels are decoded without remapping so the hypotheses stay distinct.
 */
class BayesianTopKFusion : public FusionStrategy {
public:
    explicit BayesianTopKFusion(const FusionContext& context);

    void fuse(const cv::Mat& image, FusionProducts& products) override;
    FusionMode getMode() const override { return FusionMode::SEMANTICS_BAYESIAN; }
    const char* getName() const override { return "BayesianTopK"; }

    /**
     * @throws FrameError if the distribution has fewer than kTopK classes
     */
    void fuseProbabilities(const cv::Mat& probabilities, FusionProducts& products) const;

private:
    FusionContext context_;
};

/**
 * @brief Create the strategy for a mode
 * @throws ConfigurationError if a semantic mode lacks a required collaborator
 */
std::unique_ptr<FusionStrategy> createFusionStrategy(FusionMode mode, const FusionContext& context);

namespace fusion_utils {

const char* modeToString(FusionMode mode);

/**
 * @brief Parse "color"/"max"/"bayesian" (any case) or "0"/"1"/"2"
 * @throws ConfigurationError for anything else
 */
FusionMode stringToMode(const std::string& mode_str);

/**
 * @throws ConfigurationError if value is not 0, 1 or 2
 */
FusionMode intToMode(int value);

/**
 * @brief Per-pixel argmax and max probability
 * @param probabilities CV_32FC(C)
 * @param labels Output CV_32SC1
 * @param confidence Output CV_32FC1
 */
void argmaxChannels(const cv::Mat& probabilities, cv::Mat& labels, cv::Mat& confidence);

/**
 * @brief Per-pixel top-k classes, probability descending then index ascending
 * @param labels Output, k CV_32SC1 maps
 * @param confidences Output, k CV_32FC1 maps
 */
void topKChannels(const cv::Mat& probabilities, int k,
                  std::vector<cv::Mat>& labels, std::vector<cv::Mat>& confidences);

} // namespace fusion_utils

} // namespace fusion
} // namespace semcloud
