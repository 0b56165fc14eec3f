#include "batchorchestrator.h"
#include "backuprelocator.h"
#include "logging.h"
#include "workerpool.h"
#include <QElapsedTimer>
#include <QFileInfo>
#include <QStringList>

BatchOrchestrator::BatchOrchestrator(QObject *parent)
    : QObject(parent),
      m_workerPool(new WorkerPool(this))
{
}

BatchReport BatchOrchestrator::runBatch(const BatchConfig& config)
{
    ConfigManager::validate(config);

    QElapsedTimer timer;
    timer.start();

    qCInfo(lcBatch).noquote() << QString("Starting batch in %1: subtractor %2, %3 worker(s), backup directory %4")
                                 .arg(config.path,
                                      FrameTransformer::kindName(config.subtractor))
                                 .arg(config.maxWorkers)
                                 .arg(config.destDir);

    // Originals must be safely archived before anything reads them
    BatchReport report;
    report.relocation = BackupRelocator::relocate(config.path, config.destDir, config.videoPatterns);

    QStringList names;
    for (const RelocatedFile& file : report.relocation.files) {
        names.append(QFileInfo(file.originalPath).fileName());
    }
    qCInfo(lcBatch).noquote() << "Finished moving the old videos to the destination directory, file list is"
                              << names.join(", ");

    const QList<ConversionJob> jobs = buildJobs(report.relocation, config);
    emit batchStarted(report.relocation.sourceDir, jobs.size());

    if (!config.workerProgram.isEmpty()) {
        m_workerPool->setWorkerProgram(config.workerProgram);
    }

    qCInfo(lcBatch) << "Starting the conversion of the videos";
    report.addResults(m_workerPool->run(jobs, config.maxWorkers));
    report.elapsedSeconds = timer.elapsed() / 1000.0;
    qCInfo(lcBatch) << "Finished the conversion of the videos";

    logSummary(report);

    if (!config.reportPath.isEmpty()) {
        QString error;
        if (report.save(config.reportPath, &error)) {
            qCInfo(lcBatch) << "Wrote batch report to" << config.reportPath;
        } else {
            qCWarning(lcBatch) << "Failed to write batch report" << config.reportPath << ":" << error;
        }
    }

    emit batchFinished(report);
    return report;
}

QList<ConversionJob> BatchOrchestrator::buildJobs(const RelocationResult& relocation, const BatchConfig& config)
{
    QList<ConversionJob> jobs;
    for (const RelocatedFile& file : relocation.files) {
        ConversionJob job;
        job.video = VideoFile(file.originalPath, file.backupPath);
        job.subtractor = config.subtractor;
        job.params = config.subtractorParams;
        job.fourcc = config.fourcc;
        job.progressInterval = config.progressInterval;
        jobs.append(job);
    }
    return jobs;
}

void BatchOrchestrator::logSummary(const BatchReport& report) const
{
    qCInfo(lcBatch).nospace() << "Batch summary: " << report.submitted << " submitted, "
                              << report.succeeded << " succeeded, " << report.failed << " failed in "
                              << report.elapsedSeconds << "s";

    for (const auto& failure : report.failures) {
        qCWarning(lcBatch).noquote() << "  failed:" << failure.first << "-" << failure.second;
    }
}
