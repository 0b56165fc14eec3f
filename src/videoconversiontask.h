#ifndef VIDEOCONVERSIONTASK_H
#define VIDEOCONVERSIONTASK_H

#include <QObject>
#include <QElapsedTimer>
#include <QString>
#include <opencv2/core.hpp>
#include "conversionjob.h"
#include "jobresult.h"

class FrameTransformer;
struct MediaStreams;

/**
 * Converts one video: decode, suppress background, encode.
 *
 * State machine OPENING -> STREAMING -> CLOSING -> DONE | FAILED.
 * run() never throws; every failure becomes a FAILED JobResult. Both media
 * streams are released on every path before the terminal state is entered.
 */
class VideoConversionTask : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Opening,
        Streaming,
        Closing,
        Done,
        Failed
    };
    Q_ENUM(State)

    explicit VideoConversionTask(const ConversionJob& job, QObject *parent = nullptr);

    /**
     * Run the conversion to completion
     * @return DONE with the frame count, or FAILED with error kind, message and frame index
     */
    JobResult run();

    State state() const { return m_state; }
    const ConversionJob& job() const { return m_job; }

    static QString stateName(State state);

signals:
    void stateChanged(VideoConversionTask::State state);
    void conversionStarted(const QString& inputPath);
    void progress(qint64 framesProcessed, double elapsedSeconds);
    void conversionError(const QString& stage, qint64 frameIndex, const QString& message);
    void conversionFinished(const JobResult& result);

private:
    /**
     * Probe the input and open decoder and encoder
     * @throws IOOpenError if either stream cannot be opened
     */
    void openStreams(MediaStreams& streams);

    /**
     * Feed every frame through the transformer into the encoder
     * @return Number of frames written
     * @throws FrameProcessingError on the first frame that fails
     */
    qint64 streamFrames(MediaStreams& streams, FrameTransformer& transformer);

    void setState(State state);
    void fail(JobResult& result, const QString& kind, const QString& message, qint64 frameIndex);
    QString displayName() const;

    ConversionJob m_job;
    State m_state;
    cv::Size m_frameSize;
    QElapsedTimer m_timer;

    // Fallback when neither decoder nor container report a frame rate
    static constexpr double DEFAULT_FRAME_RATE = 25.0;
};

#endif // VIDEOCONVERSIONTASK_H
