#ifndef CONVERSIONJOB_H
#define CONVERSIONJOB_H

#include <QString>
#include <QStringList>
#include "frametransformer.h"

class QCommandLineParser;

struct VideoFile {
    QString sourcePath;     // Where the video was discovered
    QString backupPath;     // Where the original now lives, read by the converter
    QString outputPath;     // Where the converted video is written (same as sourcePath)

    VideoFile() = default;
    VideoFile(const QString& source, const QString& backup)
        : sourcePath(source), backupPath(backup), outputPath(source) {}
};

/**
 * One video bound to one background model configuration.
 * Serializes to the worker-mode command line so a separate process can run it.
 */
struct ConversionJob {
    VideoFile video;
    SubtractorKind subtractor;
    SubtractorParams params;
    QString fourcc;
    qint64 progressInterval;

    ConversionJob() :
        subtractor(SubtractorKind::MOG2),
        fourcc("mp4v"),
        progressInterval(10000)
    {}

    /**
     * Arguments that make this application run the job in worker mode
     * @return Argument list starting with "--worker"
     */
    QStringList toArguments() const;

    /**
     * Register the worker-mode options (hidden from --help)
     * @param parser Parser to extend
     */
    static void addWorkerOptions(QCommandLineParser& parser);

    /**
     * Rebuild a job from a parsed worker-mode command line
     * @param parser Parser that has processed the worker arguments
     * @return Job to run
     * @throws ConfigurationError if a required option is missing or malformed
     */
    static ConversionJob fromCommandLine(const QCommandLineParser& parser);
};

#endif // CONVERSIONJOB_H
