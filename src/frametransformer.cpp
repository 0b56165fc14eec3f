#include "frametransformer.h"
#include "conversionerrors.h"
#include <opencv2/core.hpp>

double SubtractorParams::effectiveThreshold(SubtractorKind kind) const
{
    if (threshold > 0.0) {
        return threshold;
    }
    return kind == SubtractorKind::KNN ? DEFAULT_KNN_THRESHOLD : DEFAULT_MOG2_THRESHOLD;
}

FrameTransformer::FrameTransformer(SubtractorKind kind, const SubtractorParams& params)
    : m_kind(kind),
      m_framesObserved(0)
{
    const double threshold = params.effectiveThreshold(kind);

    switch (kind) {
        case SubtractorKind::MOG2:
            m_subtractor = cv::createBackgroundSubtractorMOG2(params.history, threshold,
                                                              params.detectShadows);
            break;
        case SubtractorKind::KNN:
            m_subtractor = cv::createBackgroundSubtractorKNN(params.history, threshold,
                                                             params.detectShadows);
            break;
    }
}

cv::Mat FrameTransformer::apply(const cv::Mat& frame)
{
    validateFrame(frame);

    m_subtractor->apply(frame, m_mask);
    ++m_framesObserved;

    // Shadow pixels (127 in the MOG2/KNN mask) are kept like foreground
    cv::Mat masked = cv::Mat::zeros(frame.size(), frame.type());
    cv::bitwise_and(frame, frame, masked, m_mask);
    return masked;
}

void FrameTransformer::validateFrame(const cv::Mat& frame)
{
    if (frame.empty() || frame.rows <= 0 || frame.cols <= 0) {
        throw FrameFormatError("frame has zero dimensions");
    }
    if (frame.type() != CV_8UC3) {
        throw FrameFormatError(QString("expected 8-bit 3-channel frame, got %1 channel(s) at depth %2")
                               .arg(frame.channels())
                               .arg(frame.depth()));
    }
}

QString FrameTransformer::kindName(SubtractorKind kind)
{
    switch (kind) {
        case SubtractorKind::MOG2:
            return "MOG2";
        case SubtractorKind::KNN:
            return "KNN";
    }
    return "MOG2";
}

SubtractorKind FrameTransformer::kindFromName(const QString& name)
{
    const QString normalized = name.trimmed().toUpper();
    if (normalized == "MOG2") {
        return SubtractorKind::MOG2;
    } else if (normalized == "KNN") {
        return SubtractorKind::KNN;
    }
    throw ConfigurationError(QString("unknown subtractor '%1' (expected MOG2 or KNN)").arg(name));
}
