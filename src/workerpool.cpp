#include "workerpool.h"
#include "conversionerrors.h"
#include "logging.h"
#include <QCoreApplication>
#include <QEventLoop>
#include <QFileInfo>
#include <algorithm>

WorkerPool::WorkerPool(QObject *parent)
    : QObject(parent),
      m_loop(nullptr),
      m_nextJob(0),
      m_inFlight(0),
      m_completedCount(0),
      m_peakInFlight(0)
{
}

WorkerPool::~WorkerPool()
{
    // Only reachable with live workers if run() was interrupted by an exception
    for (QProcess* process : m_processes) {
        process->disconnect(this);
        if (process->state() != QProcess::NotRunning) {
            process->kill();
            process->waitForFinished(1000);
        }
    }
}

void WorkerPool::setWorkerProgram(const QString& program)
{
    m_workerProgram = program;
}

QString WorkerPool::workerProgram() const
{
    if (!m_workerProgram.isEmpty()) {
        return m_workerProgram;
    }
    return QCoreApplication::applicationFilePath();
}

QList<JobResult> WorkerPool::run(const QList<ConversionJob>& jobs, int maxWorkers)
{
    if (maxWorkers <= 0) {
        throw ConfigurationError(QString("max workers must be a positive integer, got %1").arg(maxWorkers));
    }

    m_jobs = jobs;
    m_results.clear();
    m_completed = QVector<bool>(jobs.size(), false);
    m_nextJob = 0;
    m_inFlight = 0;
    m_completedCount = 0;
    m_peakInFlight = 0;
    m_program = workerProgram();

    if (jobs.isEmpty()) {
        return m_results;
    }

    qCInfo(lcPool) << "Dispatching" << jobs.size() << "job(s) to up to" << maxWorkers
                   << "worker(s) using" << m_program;

    QEventLoop loop;
    m_loop = &loop;

    while (m_inFlight < maxWorkers && m_nextJob < m_jobs.size()) {
        launchNext();
    }

    // Workers that fail to start may complete everything before the loop runs
    if (m_completedCount < m_jobs.size()) {
        loop.exec();
    }
    m_loop = nullptr;

    qCInfo(lcPool) << "All" << m_results.size() << "job(s) finished, peak concurrency" << m_peakInFlight;
    return m_results;
}

void WorkerPool::launchNext()
{
    const int index = m_nextJob++;
    const ConversionJob& job = m_jobs.at(index);

    QProcess* process = new QProcess(this);
    m_processes.append(process);
    process->setProgram(m_program);
    process->setArguments(job.toArguments() + m_extraArguments);

    // Worker logs go straight to our stderr, stdout carries the result
    process->setProcessChannelMode(QProcess::ForwardedErrorChannel);

    connect(process, qOverload<int, QProcess::ExitStatus>(&QProcess::finished), this,
            [this, index, process](int exitCode, QProcess::ExitStatus exitStatus) {
                onWorkerFinished(index, process, exitCode, exitStatus);
            });
    connect(process, &QProcess::errorOccurred, this,
            [this, index, process](QProcess::ProcessError error) {
                onWorkerError(index, process, error);
            });

    ++m_inFlight;
    m_peakInFlight = std::max(m_peakInFlight, m_inFlight);

    qCDebug(lcPool) << "Starting worker for" << job.video.backupPath << "(" << m_inFlight << "in flight)";
    emit jobStarted(index, job.video.backupPath);
    process->start();
}

void WorkerPool::onWorkerFinished(int index, QProcess* process, int exitCode, QProcess::ExitStatus exitStatus)
{
    const ConversionJob& job = m_jobs.at(index);
    const QByteArray output = process->readAllStandardOutput();

    JobResult result;
    QString parseError;

    if (exitStatus == QProcess::CrashExit) {
        result = JobResult::failure(job.video.backupPath, job.video.outputPath, "WorkerError",
                                    QString("worker crashed: %1").arg(process->errorString()));
    } else if (exitCode != 0) {
        result = JobResult::failure(job.video.backupPath, job.video.outputPath, "WorkerError",
                                    QString("worker exited with code %1").arg(exitCode));
    } else if (!JobResult::fromWorkerOutput(output, result, &parseError)) {
        result = JobResult::failure(job.video.backupPath, job.video.outputPath, "WorkerError", parseError);
    }

    if (result.inputPath.isEmpty()) {
        result.inputPath = job.video.backupPath;
    }
    if (result.outputPath.isEmpty()) {
        result.outputPath = job.video.outputPath;
    }

    completeJob(index, process, result);
}

void WorkerPool::onWorkerError(int index, QProcess* process, QProcess::ProcessError error)
{
    // Crashes also emit finished(), which reports them
    if (error != QProcess::FailedToStart) {
        return;
    }

    const ConversionJob& job = m_jobs.at(index);
    completeJob(index, process,
                JobResult::failure(job.video.backupPath, job.video.outputPath, "WorkerError",
                                   QString("failed to start worker %1: %2").arg(m_program, process->errorString())));
}

void WorkerPool::completeJob(int index, QProcess* process, JobResult result)
{
    if (m_completed[index]) {
        return;
    }
    m_completed[index] = true;

    --m_inFlight;
    ++m_completedCount;
    m_results.append(result);
    m_processes.removeOne(process);
    process->deleteLater();

    const QString name = QFileInfo(result.outputPath).fileName();
    if (result.succeeded()) {
        qCInfo(lcPool) << "Job" << name << "finished:" << result.framesProcessed << "frames";
    } else {
        qCWarning(lcPool).noquote() << QString("Job %1 failed (%2): %3")
                                       .arg(name, result.errorKind, result.errorMessage);
    }
    emit jobFinished(index, result);

    if (m_nextJob < m_jobs.size()) {
        launchNext();
    } else if (m_completedCount == m_jobs.size() && m_loop) {
        m_loop->quit();
    }
}
