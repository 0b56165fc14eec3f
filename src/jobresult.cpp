#include "jobresult.h"
#include <QJsonDocument>
#include <QJsonParseError>
#include <QList>

JobResult JobResult::failure(const QString& inputPath, const QString& outputPath,
                             const QString& errorKind, const QString& errorMessage)
{
    JobResult result;
    result.status = JobStatus::Failed;
    result.inputPath = inputPath;
    result.outputPath = outputPath;
    result.errorKind = errorKind;
    result.errorMessage = errorMessage;
    return result;
}

QJsonObject JobResult::toJson() const
{
    QJsonObject json;
    json["status"] = statusName(status);
    json["input"] = inputPath;
    json["output"] = outputPath;
    json["frames"] = static_cast<double>(framesProcessed);
    json["elapsedSeconds"] = elapsedSeconds;

    if (status == JobStatus::Failed) {
        json["errorKind"] = errorKind;
        json["errorMessage"] = errorMessage;
        json["frameIndex"] = static_cast<double>(frameIndex);
    }
    return json;
}

QByteArray JobResult::toJsonLine() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

bool JobResult::fromJson(const QJsonObject& json, JobResult& result, QString* error)
{
    const QString status = json.value("status").toString();
    if (status == statusName(JobStatus::Done)) {
        result.status = JobStatus::Done;
    } else if (status == statusName(JobStatus::Failed)) {
        result.status = JobStatus::Failed;
    } else {
        if (error) {
            *error = QString("unknown job status '%1'").arg(status);
        }
        return false;
    }

    result.inputPath = json.value("input").toString();
    result.outputPath = json.value("output").toString();
    result.framesProcessed = static_cast<qint64>(json.value("frames").toDouble(0));
    result.elapsedSeconds = json.value("elapsedSeconds").toDouble(0.0);
    result.errorKind = json.value("errorKind").toString();
    result.errorMessage = json.value("errorMessage").toString();
    result.frameIndex = static_cast<qint64>(json.value("frameIndex").toDouble(-1));
    return true;
}

bool JobResult::fromWorkerOutput(const QByteArray& output, JobResult& result, QString* error)
{
    // The result is the last line that parses as a JSON object
    const QList<QByteArray> lines = output.split('\n');
    for (auto it = lines.crbegin(); it != lines.crend(); ++it) {
        const QByteArray line = it->trimmed();
        if (line.isEmpty() || !line.startsWith('{')) {
            continue;
        }

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            continue;
        }
        return fromJson(doc.object(), result, error);
    }

    if (error) {
        *error = "worker produced no result";
    }
    return false;
}

QString JobResult::statusName(JobStatus status)
{
    switch (status) {
        case JobStatus::Done:
            return "DONE";
        case JobStatus::Failed:
            return "FAILED";
    }
    return "FAILED";
}
