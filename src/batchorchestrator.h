#ifndef BATCHORCHESTRATOR_H
#define BATCHORCHESTRATOR_H

#include <QObject>
#include <QList>
#include <QString>
#include "batchreport.h"
#include "configmanager.h"
#include "conversionjob.h"

class WorkerPool;

class BatchOrchestrator : public QObject
{
    Q_OBJECT

public:
    explicit BatchOrchestrator(QObject *parent = nullptr);

    /**
     * Convert every video of the configured source directory
     * @param config Batch configuration
     * @return Report with one entry per submitted video
     * @throws ConfigurationError for invalid settings or an unresolved backup collision
     * @throws RelocationError if the originals could not be archived; nothing is converted
     */
    BatchReport runBatch(const BatchConfig& config);

    /**
     * Build one job per relocated video
     * @param relocation Result of the backup step
     * @param config Batch configuration supplying the model and codec settings
     * @return Jobs in relocation order
     */
    static QList<ConversionJob> buildJobs(const RelocationResult& relocation, const BatchConfig& config);

    WorkerPool* workerPool() const { return m_workerPool; }

signals:
    void batchStarted(const QString& sourceDir, int videoCount);
    void batchFinished(const BatchReport& report);

private:
    void logSummary(const BatchReport& report) const;

    WorkerPool* m_workerPool;
};

#endif // BATCHORCHESTRATOR_H
