#ifndef WORKERPOOL_H
#define WORKERPOOL_H

#include <QObject>
#include <QList>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <QVector>
#include "conversionjob.h"
#include "jobresult.h"

class QEventLoop;

/**
 * Runs conversion jobs in separate worker processes.
 *
 * Each job gets its own process (this application re-executed with
 * "--worker"), so codec and model state never share an address space.
 * At most maxWorkers processes run at once; whenever one exits the next
 * unstarted job is launched. Results come back in completion order.
 */
class WorkerPool : public QObject
{
    Q_OBJECT

public:
    explicit WorkerPool(QObject *parent = nullptr);
    ~WorkerPool();

    /**
     * Executable started for every job; defaults to the running application
     */
    void setWorkerProgram(const QString& program);
    QString workerProgram() const;

    /**
     * Arguments appended to every worker command line (e.g. "--verbose")
     */
    void setExtraArguments(const QStringList& arguments) { m_extraArguments = arguments; }

    /**
     * Run every job and wait for all of them
     * @param jobs Jobs to run, each exactly once
     * @param maxWorkers Upper bound on concurrently running workers
     * @return One result per job, in completion order
     * @throws ConfigurationError if maxWorkers is not positive; nothing is started
     */
    QList<JobResult> run(const QList<ConversionJob>& jobs, int maxWorkers);

    /**
     * Highest number of simultaneously running workers seen by the last run()
     */
    int peakInFlight() const { return m_peakInFlight; }

signals:
    void jobStarted(int index, const QString& inputPath);
    void jobFinished(int index, const JobResult& result);

private:
    void launchNext();
    void onWorkerFinished(int index, QProcess* process, int exitCode, QProcess::ExitStatus exitStatus);
    void onWorkerError(int index, QProcess* process, QProcess::ProcessError error);
    void completeJob(int index, QProcess* process, JobResult result);

    QString m_workerProgram;
    QStringList m_extraArguments;

    // State of the current run()
    QList<ConversionJob> m_jobs;
    QList<JobResult> m_results;
    QVector<bool> m_completed;
    QList<QProcess*> m_processes;
    QEventLoop* m_loop;
    QString m_program;
    int m_nextJob;
    int m_inFlight;
    int m_completedCount;
    int m_peakInFlight;
};

#endif // WORKERPOOL_H
