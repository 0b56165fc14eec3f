#include <QCoreApplication>
#include <QCommandLineParser>
#include <cstdio>
#include "batchorchestrator.h"
#include "configmanager.h"
#include "conversionerrors.h"
#include "conversionjob.h"
#include "logging.h"
#include "videoconversiontask.h"
#include "workerpool.h"

namespace {

enum ExitCode {
    EXIT_BATCH_COMPLETED = 0,
    EXIT_CONFIGURATION_ERROR = 1,
    EXIT_RELOCATION_ERROR = 2,
    EXIT_WORKER_USAGE_ERROR = 3
};

// Runs one job in this process and prints its result on stdout
int runWorker(const QCommandLineParser& parser)
{
    ConversionJob job;
    try {
        job = ConversionJob::fromCommandLine(parser);
    } catch (const ConfigurationError& e) {
        qCCritical(lcConvert).noquote() << "Invalid worker invocation:" << e.message();
        return EXIT_WORKER_USAGE_ERROR;
    }

    VideoConversionTask task(job);
    const JobResult result = task.run();

    const QByteArray line = result.toJsonLine() + '\n';
    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stdout);
    std::fflush(stdout);
    return 0;
}

int runBatch(const QCommandLineParser& parser)
{
    try {
        BatchConfig config = ConfigManager::fromCommandLine(parser);

        BatchOrchestrator orchestrator;
        if (parser.isSet("verbose")) {
            orchestrator.workerPool()->setExtraArguments({"--verbose"});
        }

        orchestrator.runBatch(config);
    } catch (const ConfigurationError& e) {
        qCCritical(lcBatch).noquote() << "Configuration error:" << e.message();
        return EXIT_CONFIGURATION_ERROR;
    } catch (const RelocationError& e) {
        qCCritical(lcBatch).noquote() << "Could not archive the original videos, nothing was converted:" << e.message();
        return EXIT_RELOCATION_ERROR;
    }

    // Per-video failures are in the report; the batch itself completed
    return EXIT_BATCH_COMPLETED;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("MotionMask");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("MotionMask");

    QCommandLineParser parser;
    parser.setApplicationDescription("Add background subtraction to videos");
    parser.addHelpOption();
    parser.addVersionOption();
    ConfigManager::addOptions(parser);
    ConversionJob::addWorkerOptions(parser);
    parser.process(app);

    Logging::install(parser.isSet("verbose"));

    if (parser.isSet("worker")) {
        return runWorker(parser);
    }
    return runBatch(parser);
}
