#include "videoconversiontask.h"
#include "conversionerrors.h"
#include "frametransformer.h"
#include "logging.h"
#include "videoprobe.h"
#include <QFileInfo>
#include <cmath>
#include <opencv2/videoio.hpp>

// Owns both media handles for one conversion; destruction is the CLOSING step
struct MediaStreams {
    cv::VideoCapture capture;
    cv::VideoWriter writer;

    MediaStreams() = default;
    MediaStreams(const MediaStreams&) = delete;
    MediaStreams& operator=(const MediaStreams&) = delete;

    ~MediaStreams()
    {
        try {
            release();
        } catch (const cv::Exception& e) {
            qCWarning(lcConvert) << "Error while releasing streams:" << e.what();
        }
    }

    void release()
    {
        if (writer.isOpened()) {
            writer.release();
        }
        if (capture.isOpened()) {
            capture.release();
        }
    }
};

VideoConversionTask::VideoConversionTask(const ConversionJob& job, QObject *parent)
    : QObject(parent),
      m_job(job),
      m_state(State::Opening)
{
}

JobResult VideoConversionTask::run()
{
    m_timer.start();

    JobResult result;
    result.inputPath = m_job.video.backupPath;
    result.outputPath = m_job.video.outputPath;

    emit conversionStarted(result.inputPath);
    qCInfo(lcConvert) << "Starting the conversion of the video" << displayName();

    bool failed = false;
    {
        MediaStreams streams;

        try {
            setState(State::Opening);
            FrameTransformer transformer(m_job.subtractor, m_job.params);
            openStreams(streams);

            setState(State::Streaming);
            result.framesProcessed = streamFrames(streams, transformer);
        } catch (const FrameProcessingError& e) {
            // Every frame before the failing one was already encoded
            result.framesProcessed = e.frameIndex();
            fail(result, e.kind(), e.message(), e.frameIndex());
            failed = true;
        } catch (const ConversionError& e) {
            fail(result, e.kind(), e.message(), -1);
            failed = true;
        } catch (const cv::Exception& e) {
            fail(result, "OpenCVError", QString::fromStdString(e.what()), -1);
            failed = true;
        } catch (const std::exception& e) {
            fail(result, "UnexpectedError", QString::fromStdString(e.what()), -1);
            failed = true;
        }

        setState(State::Closing);
        try {
            streams.release();
        } catch (const cv::Exception& e) {
            if (!failed) {
                fail(result, "FrameProcessingError",
                     QString("flushing output failed: %1").arg(e.what()), result.framesProcessed);
                failed = true;
            }
        }
    }
    qCInfo(lcConvert) << "Released captures for video" << displayName();

    result.elapsedSeconds = m_timer.elapsed() / 1000.0;
    result.status = failed ? JobStatus::Failed : JobStatus::Done;
    setState(failed ? State::Failed : State::Done);

    if (!failed) {
        qCInfo(lcConvert).nospace() << "Finished the conversion of the video " << displayName()
                                    << ": " << result.framesProcessed << " frames in "
                                    << result.elapsedSeconds << "s";
    }

    emit conversionFinished(result);
    return result;
}

void VideoConversionTask::openStreams(MediaStreams& streams)
{
    const QString input = m_job.video.backupPath;
    const QString output = m_job.video.outputPath;

    if (QFileInfo(input).absoluteFilePath() == QFileInfo(output).absoluteFilePath()) {
        throw IOOpenError(QString("refusing to overwrite the input video in place: %1").arg(input));
    }

    VideoProbe probe;
    if (!probe.open(input.toStdString())) {
        throw IOOpenError(QString("cannot read %1: %2").arg(input, QString::fromStdString(probe.lastError())));
    }
    qCInfo(lcProbe) << "Video Info -" << displayName() << "-" << probe.describe();

    if (!streams.capture.open(input.toStdString())) {
        throw IOOpenError(QString("failed to open video for decoding: %1").arg(input));
    }

    int width = static_cast<int>(streams.capture.get(cv::CAP_PROP_FRAME_WIDTH));
    int height = static_cast<int>(streams.capture.get(cv::CAP_PROP_FRAME_HEIGHT));
    if (width <= 0 || height <= 0) {
        width = probe.videoInfo().width;
        height = probe.videoInfo().height;
    }
    m_frameSize = cv::Size(width, height);

    double fps = streams.capture.get(cv::CAP_PROP_FPS);
    if (!std::isfinite(fps) || fps <= 0.0) {
        fps = probe.videoInfo().frameRate > 0.0 ? probe.videoInfo().frameRate : DEFAULT_FRAME_RATE;
        qCDebug(lcConvert) << "Decoder reports no frame rate for" << displayName() << "- using" << fps;
    }

    const QByteArray code = m_job.fourcc.toLatin1();
    if (code.size() != 4) {
        throw IOOpenError(QString("invalid output codec '%1'").arg(m_job.fourcc));
    }
    const int fourcc = cv::VideoWriter::fourcc(code[0], code[1], code[2], code[3]);

    if (!streams.writer.open(output.toStdString(), fourcc, fps, m_frameSize, true)) {
        throw IOOpenError(QString("failed to open output video for encoding: %1").arg(output));
    }

    qCInfo(lcConvert) << "Starting the reading of the video" << displayName()
                      << "with height" << height << "and width" << width;
}

qint64 VideoConversionTask::streamFrames(MediaStreams& streams, FrameTransformer& transformer)
{
    cv::Mat frame;
    qint64 count = 0;

    while (true) {
        bool decoded = false;
        try {
            decoded = streams.capture.read(frame);
        } catch (const cv::Exception& e) {
            throw FrameProcessingError(count, QString("decode failed: %1").arg(e.what()));
        }
        if (!decoded || frame.empty()) {
            break;
        }

        if (frame.size() != m_frameSize) {
            throw FrameProcessingError(count, QString("FrameFormatError: frame is %1x%2, stream is %3x%4")
                                       .arg(frame.cols).arg(frame.rows)
                                       .arg(m_frameSize.width).arg(m_frameSize.height));
        }

        cv::Mat masked;
        try {
            masked = transformer.apply(frame);
        } catch (const FrameFormatError& e) {
            throw FrameProcessingError(count, QString("%1: %2").arg(e.kind(), e.message()));
        } catch (const cv::Exception& e) {
            throw FrameProcessingError(count, QString("transform failed: %1").arg(e.what()));
        }

        try {
            streams.writer.write(masked);
        } catch (const cv::Exception& e) {
            throw FrameProcessingError(count, QString("encode failed: %1").arg(e.what()));
        }

        ++count;
        if (count % m_job.progressInterval == 0) {
            const double elapsed = m_timer.elapsed() / 1000.0;
            qCInfo(lcConvert) << "Processing frame" << count << "of" << displayName();
            emit progress(count, elapsed);
        }
    }

    return count;
}

void VideoConversionTask::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    qCDebug(lcConvert) << displayName() << "->" << stateName(state);
    emit stateChanged(state);
}

void VideoConversionTask::fail(JobResult& result, const QString& kind, const QString& message, qint64 frameIndex)
{
    result.status = JobStatus::Failed;
    result.errorKind = kind;
    result.errorMessage = message;
    result.frameIndex = frameIndex;

    const QString stage = stateName(m_state);
    qCCritical(lcConvert).noquote() << QString("Error processing the video %1 during %2 with error %3: %4")
                                       .arg(displayName(), stage, kind, message);
    emit conversionError(stage, frameIndex, message);
}

QString VideoConversionTask::displayName() const
{
    return QFileInfo(m_job.video.outputPath).fileName();
}

QString VideoConversionTask::stateName(State state)
{
    switch (state) {
        case State::Opening:
            return "OPENING";
        case State::Streaming:
            return "STREAMING";
        case State::Closing:
            return "CLOSING";
        case State::Done:
            return "DONE";
        case State::Failed:
            return "FAILED";
    }
    return "UNKNOWN";
}
