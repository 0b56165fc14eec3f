#ifndef FRAMETRANSFORMER_H
#define FRAMETRANSFORMER_H

#include <QString>
#include <opencv2/core.hpp>
#include <opencv2/video/background_segm.hpp>

enum class SubtractorKind {
    MOG2,
    KNN
};

/**
 * Tuning parameters for the background model.
 * A threshold of 0 selects the library default for the chosen algorithm
 * (varThreshold 16 for MOG2, dist2Threshold 400 for KNN).
 */
struct SubtractorParams {
    int history;
    double threshold;
    bool detectShadows;

    SubtractorParams() :
        history(500),
        threshold(0.0),
        detectShadows(true)
    {}

    static constexpr double DEFAULT_MOG2_THRESHOLD = 16.0;
    static constexpr double DEFAULT_KNN_THRESHOLD = 400.0;

    /**
     * Threshold actually handed to OpenCV for the given algorithm
     */
    double effectiveThreshold(SubtractorKind kind) const;
};

/**
 * Per-frame background suppression.
 *
 * Wraps one cv::BackgroundSubtractor chosen at construction. The model is
 * stateful: frames must be applied in decode order and none may be skipped.
 * One instance belongs to exactly one video.
 */
class FrameTransformer
{
public:
    explicit FrameTransformer(SubtractorKind kind,
                              const SubtractorParams& params = SubtractorParams());

    /**
     * Update the background model with a frame and suppress its background
     * @param frame Decoded BGR frame (CV_8UC3)
     * @return Frame of the same size and type with background pixels set to zero
     * @throws FrameFormatError if the frame is empty or not CV_8UC3
     */
    cv::Mat apply(const cv::Mat& frame);

    /**
     * Foreground mask produced by the most recent apply() call
     */
    const cv::Mat& lastMask() const { return m_mask; }

    SubtractorKind kind() const { return m_kind; }

    /**
     * Number of frames fed into the model so far
     */
    qint64 framesObserved() const { return m_framesObserved; }

    /**
     * Get algorithm name as string
     * @param kind Subtractor kind
     * @return "MOG2" or "KNN"
     */
    static QString kindName(SubtractorKind kind);

    /**
     * Parse an algorithm name, case-insensitively
     * @param name "MOG2" or "KNN"
     * @return Subtractor kind
     * @throws ConfigurationError for any other name
     */
    static SubtractorKind kindFromName(const QString& name);

private:
    static void validateFrame(const cv::Mat& frame);

    SubtractorKind m_kind;
    cv::Ptr<cv::BackgroundSubtractor> m_subtractor;
    cv::Mat m_mask;
    qint64 m_framesObserved;
};

#endif // FRAMETRANSFORMER_H
