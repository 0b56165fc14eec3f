#include "conversionjob.h"
#include "conversionerrors.h"
#include <QCommandLineOption>
#include <QCommandLineParser>

namespace {

QCommandLineOption hidden(const QString& name, const QString& description, const QString& valueName = QString())
{
    QCommandLineOption option(name, description, valueName);
    option.setFlags(QCommandLineOption::HiddenFromHelp);
    return option;
}

QString requireValue(const QCommandLineParser& parser, const QString& name)
{
    if (!parser.isSet(name) || parser.value(name).isEmpty()) {
        throw ConfigurationError(QString("worker mode requires --%1").arg(name));
    }
    return parser.value(name);
}

} // namespace

QStringList ConversionJob::toArguments() const
{
    return {
        "--worker",
        "--input", video.backupPath,
        "--output", video.outputPath,
        "--subtractor", FrameTransformer::kindName(subtractor),
        "--fourcc", fourcc,
        "--progress-interval", QString::number(progressInterval),
        "--history", QString::number(params.history),
        "--threshold", QString::number(params.threshold, 'g', 17),
        "--shadows", params.detectShadows ? "1" : "0"
    };
}

void ConversionJob::addWorkerOptions(QCommandLineParser& parser)
{
    parser.addOption(hidden("worker", "Run a single conversion job and print its result."));
    parser.addOption(hidden("input", "Video to read.", "file"));
    parser.addOption(hidden("output", "Video to write.", "file"));
    parser.addOption(hidden("fourcc", "Output codec.", "code"));
    parser.addOption(hidden("progress-interval", "Frames between progress events.", "frames"));
    parser.addOption(hidden("history", "Background model history.", "frames"));
    parser.addOption(hidden("threshold", "Background model threshold.", "value"));
    parser.addOption(hidden("shadows", "Detect shadows (1 or 0).", "flag"));
}

ConversionJob ConversionJob::fromCommandLine(const QCommandLineParser& parser)
{
    ConversionJob job;

    const QString input = requireValue(parser, "input");
    job.video.sourcePath = requireValue(parser, "output");
    job.video.backupPath = input;
    job.video.outputPath = job.video.sourcePath;

    if (parser.isSet("subtractor")) {
        job.subtractor = FrameTransformer::kindFromName(parser.value("subtractor"));
    }
    if (parser.isSet("fourcc")) {
        job.fourcc = parser.value("fourcc");
        if (job.fourcc.size() != 4) {
            throw ConfigurationError(QString("fourcc must be exactly four characters, got '%1'").arg(job.fourcc));
        }
    }

    bool ok = true;
    if (parser.isSet("progress-interval")) {
        job.progressInterval = parser.value("progress-interval").toLongLong(&ok);
        if (!ok || job.progressInterval <= 0) {
            throw ConfigurationError("--progress-interval expects a positive integer");
        }
    }
    if (parser.isSet("history")) {
        job.params.history = parser.value("history").toInt(&ok);
        if (!ok || job.params.history <= 0) {
            throw ConfigurationError("--history expects a positive integer");
        }
    }
    if (parser.isSet("threshold")) {
        job.params.threshold = parser.value("threshold").toDouble(&ok);
        if (!ok || job.params.threshold < 0.0) {
            throw ConfigurationError("--threshold expects a non-negative number");
        }
    }
    if (parser.isSet("shadows")) {
        job.params.detectShadows = parser.value("shadows") != "0";
    }

    return job;
}
