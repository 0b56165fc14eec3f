#ifndef CONVERSIONERRORS_H
#define CONVERSIONERRORS_H

#include <QString>
#include <stdexcept>
#include <string>

/**
 * @brief Base class for every error raised by the conversion pipeline
 *
 * Batch-level errors (configuration, relocation) propagate out of
 * BatchOrchestrator::runBatch. Job-level errors (open, frame) are caught
 * at the task boundary and turned into a JobResult.
 */
class ConversionError : public std::runtime_error
{
public:
    explicit ConversionError(const QString& message)
        : std::runtime_error(message.toStdString()) {}

    QString message() const { return QString::fromStdString(what()); }

    /**
     * @brief Short, stable name of the error kind ("IOOpenError", ...)
     */
    virtual QString kind() const { return "ConversionError"; }
};

// Invalid worker count, unreadable source path, unresolved backup collision
class ConfigurationError : public ConversionError
{
public:
    using ConversionError::ConversionError;
    QString kind() const override { return "ConfigurationError"; }
};

// Move or rename failure while archiving originals
class RelocationError : public ConversionError
{
public:
    using ConversionError::ConversionError;
    QString kind() const override { return "RelocationError"; }
};

// A video cannot be opened for decode, or its output cannot be opened for encode
class IOOpenError : public ConversionError
{
public:
    using ConversionError::ConversionError;
    QString kind() const override { return "IOOpenError"; }
};

// Frame with zero dimensions or an unexpected pixel layout
class FrameFormatError : public ConversionError
{
public:
    using ConversionError::ConversionError;
    QString kind() const override { return "FrameFormatError"; }
};

/**
 * @brief Decode, transform or encode failure on a specific frame
 */
class FrameProcessingError : public ConversionError
{
public:
    FrameProcessingError(qint64 frameIndex, const QString& cause)
        : ConversionError(QString("frame %1: %2").arg(frameIndex).arg(cause)),
          m_frameIndex(frameIndex),
          m_cause(cause) {}

    QString kind() const override { return "FrameProcessingError"; }

    qint64 frameIndex() const { return m_frameIndex; }
    QString cause() const { return m_cause; }

private:
    qint64 m_frameIndex;
    QString m_cause;
};

#endif // CONVERSIONERRORS_H
