#include "batchreport.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>

void BatchReport::addResults(const QList<JobResult>& jobResults)
{
    for (const JobResult& result : jobResults) {
        results.append(result);
        ++submitted;
        if (result.succeeded()) {
            ++succeeded;
        } else {
            ++failed;
            QString error = result.errorKind.isEmpty()
                ? result.errorMessage
                : QString("%1: %2").arg(result.errorKind, result.errorMessage);
            failures.append(qMakePair(result.outputPath, error));
        }
    }
}

QJsonObject BatchReport::toJson() const
{
    QJsonObject root;
    root["version"] = "1.0";
    root["submitted"] = submitted;
    root["succeeded"] = succeeded;
    root["failed"] = failed;
    root["elapsedSeconds"] = elapsedSeconds;

    QJsonObject backup;
    backup["sourceDir"] = relocation.sourceDir;
    backup["backupDir"] = relocation.backupDir;
    backup["archivedDir"] = relocation.archivedDir;
    root["relocation"] = backup;

    QJsonArray videos;
    for (const JobResult& result : results) {
        videos.append(result.toJson());
    }
    root["videos"] = videos;

    QJsonArray failureList;
    for (const auto& failure : failures) {
        QJsonObject entry;
        entry["path"] = failure.first;
        entry["error"] = failure.second;
        failureList.append(entry);
    }
    root["failures"] = failureList;

    return root;
}

bool BatchReport::save(const QString& filePath, QString* error) const
{
    QDir dir = QFileInfo(filePath).absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        if (error) {
            *error = QString("failed to create directory %1").arg(dir.absolutePath());
        }
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error) {
            *error = file.errorString();
        }
        return false;
    }

    const QByteArray data = QJsonDocument(toJson()).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        if (error) {
            *error = file.errorString();
        }
        return false;
    }
    file.close();

    return true;
}
