#ifndef BATCHREPORT_H
#define BATCHREPORT_H

#include <QJsonObject>
#include <QList>
#include <QPair>
#include <QString>
#include "backuprelocator.h"
#include "jobresult.h"

/**
 * @brief Summary of one batch run
 *
 * Per-video failures are listed here but do not make the batch itself fail;
 * only configuration and relocation errors do, and those never produce a report.
 */
struct BatchReport {
    int submitted;
    int succeeded;
    int failed;
    QList<QPair<QString, QString>> failures;   // (video path, error)
    QList<JobResult> results;
    RelocationResult relocation;
    double elapsedSeconds;

    BatchReport() :
        submitted(0),
        succeeded(0),
        failed(0),
        elapsedSeconds(0.0)
    {}

    /**
     * @brief Count results and collect failures
     * @param jobResults One result per submitted job
     */
    void addResults(const QList<JobResult>& jobResults);

    QJsonObject toJson() const;

    /**
     * @brief Write the report as indented JSON
     * @param filePath Destination file, overwritten if present
     * @param error Receives a description on failure, may be nullptr
     * @return true if the file was written
     */
    bool save(const QString& filePath, QString* error = nullptr) const;
};

#endif // BATCHREPORT_H
