#include "configmanager.h"
#include "conversionerrors.h"
#include <QCommandLineParser>
#include <QFileInfo>
#include <climits>

// Configuration keys
const QString ConfigManager::KEY_PATH = "path";
const QString ConfigManager::KEY_DEST_DIR = "destDir";
const QString ConfigManager::KEY_MAX_WORKERS = "maxWorkers";
const QString ConfigManager::KEY_SUBTRACTOR = "subtractor";
const QString ConfigManager::KEY_VIDEO_PATTERNS = "videoPatterns";
const QString ConfigManager::KEY_FOURCC = "fourcc";
const QString ConfigManager::KEY_PROGRESS_INTERVAL = "progressInterval";
const QString ConfigManager::KEY_HISTORY = "model/history";
const QString ConfigManager::KEY_THRESHOLD = "model/threshold";
const QString ConfigManager::KEY_DETECT_SHADOWS = "model/detectShadows";
const QString ConfigManager::KEY_REPORT_PATH = "reportPath";

void ConfigManager::loadFile(BatchConfig& config, const QString& filePath)
{
    QFileInfo info(filePath);
    if (!info.exists() || !info.isFile() || !info.isReadable()) {
        throw ConfigurationError(QString("config file not readable: %1").arg(filePath));
    }

    QSettings settings(filePath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        throw ConfigurationError(QString("config file could not be parsed: %1").arg(filePath));
    }
    loadSettings(config, settings);
}

void ConfigManager::loadSettings(BatchConfig& config, const QSettings& settings)
{
    config.path = settings.value(KEY_PATH, config.path).toString();
    config.destDir = settings.value(KEY_DEST_DIR, config.destDir).toString();
    config.maxWorkers = settings.value(KEY_MAX_WORKERS, config.maxWorkers).toInt();

    if (settings.contains(KEY_SUBTRACTOR)) {
        config.subtractor = FrameTransformer::kindFromName(settings.value(KEY_SUBTRACTOR).toString());
    }

    config.videoPatterns = settings.value(KEY_VIDEO_PATTERNS, config.videoPatterns).toStringList();
    config.fourcc = settings.value(KEY_FOURCC, config.fourcc).toString();
    config.progressInterval = settings.value(KEY_PROGRESS_INTERVAL, config.progressInterval).toLongLong();

    config.subtractorParams.history = settings.value(KEY_HISTORY, config.subtractorParams.history).toInt();
    config.subtractorParams.threshold = settings.value(KEY_THRESHOLD, config.subtractorParams.threshold).toDouble();
    config.subtractorParams.detectShadows = settings.value(KEY_DETECT_SHADOWS, config.subtractorParams.detectShadows).toBool();

    config.reportPath = settings.value(KEY_REPORT_PATH, config.reportPath).toString();
}

void ConfigManager::saveSettings(const BatchConfig& config, QSettings& settings)
{
    settings.setValue(KEY_PATH, config.path);
    settings.setValue(KEY_DEST_DIR, config.destDir);
    settings.setValue(KEY_MAX_WORKERS, config.maxWorkers);
    settings.setValue(KEY_SUBTRACTOR, FrameTransformer::kindName(config.subtractor));
    settings.setValue(KEY_VIDEO_PATTERNS, config.videoPatterns);
    settings.setValue(KEY_FOURCC, config.fourcc);
    settings.setValue(KEY_PROGRESS_INTERVAL, config.progressInterval);
    settings.setValue(KEY_HISTORY, config.subtractorParams.history);
    settings.setValue(KEY_THRESHOLD, config.subtractorParams.threshold);
    settings.setValue(KEY_DETECT_SHADOWS, config.subtractorParams.detectShadows);
    settings.setValue(KEY_REPORT_PATH, config.reportPath);

    settings.sync();
}

void ConfigManager::addOptions(QCommandLineParser& parser)
{
    parser.addOptions({
        {"path", "The path to the video files.", "directory"},
        {"dest-dir", "The directory to move the old videos to.", "directory"},
        {"max-workers", "The number of workers to use in processing the videos.", "count"},
        {"subtractor", "The background subtractor to use (MOG2 or KNN).", "name"},
        {"config", "INI file with batch settings.", "file"},
        {"report", "Write a JSON batch report to this file.", "file"},
        {"verbose", "Enable debug logging."}
    });
}

BatchConfig ConfigManager::fromCommandLine(const QCommandLineParser& parser)
{
    BatchConfig config;

    if (parser.isSet("config")) {
        loadFile(config, parser.value("config"));
    }

    if (parser.isSet("path")) {
        config.path = parser.value("path");
    }
    if (parser.isSet("dest-dir")) {
        config.destDir = parser.value("dest-dir");
    }
    if (parser.isSet("max-workers")) {
        config.maxWorkers = static_cast<int>(parseInteger(parser.value("max-workers"), "--max-workers"));
    }
    if (parser.isSet("subtractor")) {
        config.subtractor = FrameTransformer::kindFromName(parser.value("subtractor"));
    }
    if (parser.isSet("report")) {
        config.reportPath = parser.value("report");
    }

    return config;
}

void ConfigManager::validate(const BatchConfig& config)
{
    if (config.maxWorkers <= 0) {
        throw ConfigurationError(QString("max workers must be a positive integer, got %1").arg(config.maxWorkers));
    }
    if (config.path.isEmpty()) {
        throw ConfigurationError("source path is empty");
    }
    if (config.destDir.isEmpty()) {
        throw ConfigurationError("destination directory is empty");
    }
    if (config.videoPatterns.isEmpty()) {
        throw ConfigurationError("no video name patterns configured");
    }
    if (config.fourcc.size() != 4) {
        throw ConfigurationError(QString("fourcc must be exactly four characters, got '%1'").arg(config.fourcc));
    }
    if (config.progressInterval <= 0) {
        throw ConfigurationError(QString("progress interval must be positive, got %1").arg(config.progressInterval));
    }
    if (config.subtractorParams.history <= 0) {
        throw ConfigurationError(QString("subtractor history must be positive, got %1").arg(config.subtractorParams.history));
    }
    if (config.subtractorParams.threshold < 0.0) {
        throw ConfigurationError(QString("subtractor threshold must not be negative, got %1").arg(config.subtractorParams.threshold));
    }
}

qint64 ConfigManager::parseInteger(const QString& value, const QString& name)
{
    bool ok = false;
    const qint64 parsed = value.trimmed().toLongLong(&ok);
    if (!ok || parsed < INT_MIN || parsed > INT_MAX) {
        throw ConfigurationError(QString("%1 expects an integer, got '%2'").arg(name, value));
    }
    return parsed;
}
