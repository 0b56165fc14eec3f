#ifndef JOBRESULT_H
#define JOBRESULT_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>

enum class JobStatus {
    Done,
    Failed
};

/**
 * @brief Outcome of converting one video
 *
 * Produced exactly once per job. A worker process prints it as one line of
 * compact JSON on stdout; the pool parses it back.
 */
struct JobResult {
    JobStatus status;
    QString inputPath;          // Backup copy the frames were read from
    QString outputPath;         // Original location the converted video was written to
    qint64 framesProcessed;
    double elapsedSeconds;

    // Failure details, empty on success
    QString errorKind;          // e.g., "IOOpenError"
    QString errorMessage;
    qint64 frameIndex;          // Frame that failed, -1 if not frame related

    JobResult() :
        status(JobStatus::Failed),
        framesProcessed(0),
        elapsedSeconds(0.0),
        frameIndex(-1)
    {}

    bool succeeded() const { return status == JobStatus::Done; }

    /**
     * @brief Build a failed result that never reached a worker's converter
     */
    static JobResult failure(const QString& inputPath, const QString& outputPath,
                             const QString& errorKind, const QString& errorMessage);

    QJsonObject toJson() const;

    /**
     * @brief Single-line JSON encoding written by worker processes
     */
    QByteArray toJsonLine() const;

    /**
     * @brief Parse a result object
     * @param json Object produced by toJson()
     * @param result Output result
     * @param error Receives a description when parsing fails, may be nullptr
     * @return true if the object holds a valid result
     */
    static bool fromJson(const QJsonObject& json, JobResult& result, QString* error = nullptr);

    /**
     * @brief Find and parse the last JSON result line in a worker's stdout
     * @param output Everything the worker wrote to stdout
     * @param result Output result
     * @param error Receives a description when no result is found, may be nullptr
     * @return true if a result line was found
     */
    static bool fromWorkerOutput(const QByteArray& output, JobResult& result, QString* error = nullptr);

    static QString statusName(JobStatus status);
};

#endif // JOBRESULT_H
