#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <cstdio>
#include <cstdlib>
#include "configmanager.h"
#include "conversionerrors.h"
#include "conversionjob.h"
#include "jobresult.h"

// Stand-in for "motionmask --worker". Copies the input to the output instead of
// converting it; the input file name selects a failure mode:
//   *corrupt*  prints a FAILED result
//   *crash*    aborts
//   *badexit*  exits with code 3 and no result
//   *silent*   exits 0 without printing a result
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    ConfigManager::addOptions(parser);
    ConversionJob::addWorkerOptions(parser);
    parser.process(app);

    ConversionJob job;
    try {
        job = ConversionJob::fromCommandLine(parser);
    } catch (const ConfigurationError& e) {
        std::fprintf(stderr, "fake worker: %s\n", e.what());
        return 3;
    }

    const QString name = QFileInfo(job.video.backupPath).fileName();
    if (name.contains("crash")) {
        std::abort();
    }
    if (name.contains("badexit")) {
        return 3;
    }

    // Long enough for sibling workers to overlap
    QThread::msleep(150);

    JobResult result;
    result.inputPath = job.video.backupPath;
    result.outputPath = job.video.outputPath;

    if (name.contains("silent")) {
        return 0;
    }

    if (name.contains("corrupt")) {
        result.status = JobStatus::Failed;
        result.errorKind = "IOOpenError";
        result.errorMessage = QString("failed to open video for decoding: %1").arg(job.video.backupPath);
    } else {
        QFile::remove(job.video.outputPath);
        if (QFile::copy(job.video.backupPath, job.video.outputPath)) {
            result.status = JobStatus::Done;
            result.framesProcessed = 1;
        } else {
            result.status = JobStatus::Failed;
            result.errorKind = "IOOpenError";
            result.errorMessage = QString("cannot write %1").arg(job.video.outputPath);
        }
    }

    // Noise before the result line, as a real worker's libraries may print
    std::fputs("fake worker: done\n", stdout);
    const QByteArray line = result.toJsonLine() + '\n';
    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stdout);
    std::fflush(stdout);
    return 0;
}
