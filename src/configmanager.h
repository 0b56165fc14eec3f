#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QSettings>
#include <QString>
#include <QStringList>
#include "frametransformer.h"

class QCommandLineParser;

struct BatchConfig {
    QString path;
    QString destDir;
    int maxWorkers;
    SubtractorKind subtractor;
    SubtractorParams subtractorParams;

    QStringList videoPatterns;
    QString fourcc;
    qint64 progressInterval;

    // Optional JSON report written after the batch
    QString reportPath;

    // Executable re-run in worker mode; empty means this application
    QString workerProgram;

    // Default values
    BatchConfig() :
        path("."),
        destDir("unsubtracted_videos"),
        maxWorkers(10),
        subtractor(SubtractorKind::MOG2),
        videoPatterns({"*.mp4"}),
        fourcc("mp4v"),
        progressInterval(10000)
    {}
};

class ConfigManager
{
public:
    /**
     * Overlay settings from an INI file onto a configuration
     * @param config Configuration to update; keys missing from the file keep their value
     * @param filePath Path to INI file
     * @throws ConfigurationError if the file is missing or unreadable, or holds an unknown subtractor
     */
    static void loadFile(BatchConfig& config, const QString& filePath);

    /**
     * Overlay settings from an open QSettings store
     * @param config Configuration to update
     * @param settings Settings store
     */
    static void loadSettings(BatchConfig& config, const QSettings& settings);

    /**
     * Write a configuration to a settings store
     * @param config Configuration to save
     * @param settings Settings store
     */
    static void saveSettings(const BatchConfig& config, QSettings& settings);

    /**
     * Register the batch-mode command line options
     * @param parser Parser to extend
     */
    static void addOptions(QCommandLineParser& parser);

    /**
     * Build the configuration from defaults, the optional --config file and
     * explicit command line options, in that order of priority
     * @param parser Parser that has already processed the arguments
     * @return Loaded configuration (not yet validated)
     * @throws ConfigurationError for unparseable values
     */
    static BatchConfig fromCommandLine(const QCommandLineParser& parser);

    /**
     * Check a configuration before any work starts
     * @param config Configuration to check
     * @throws ConfigurationError describing the first problem found
     */
    static void validate(const BatchConfig& config);

    // Configuration keys
    static const QString KEY_PATH;
    static const QString KEY_DEST_DIR;
    static const QString KEY_MAX_WORKERS;
    static const QString KEY_SUBTRACTOR;
    static const QString KEY_VIDEO_PATTERNS;
    static const QString KEY_FOURCC;
    static const QString KEY_PROGRESS_INTERVAL;
    static const QString KEY_HISTORY;
    static const QString KEY_THRESHOLD;
    static const QString KEY_DETECT_SHADOWS;
    static const QString KEY_REPORT_PATH;

private:
    static qint64 parseInteger(const QString& value, const QString& name);
};

#endif // CONFIGMANAGER_H
