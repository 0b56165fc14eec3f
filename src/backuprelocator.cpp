#include "backuprelocator.h"
#include "conversionerrors.h"
#include "logging.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>

QStringList BackupRelocator::scan(const QString& sourceDir, const QStringList& patterns)
{
    QStringList filters;
    for (const QString& pattern : patterns) {
        const QString trimmed = pattern.trimmed();
        if (!trimmed.isEmpty()) {
            filters.append(trimmed);
        }
    }

    QDir dir(sourceDir);
    return dir.entryList(filters, QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot | QDir::CaseSensitive, QDir::Name);
}

QString BackupRelocator::resolveBackupDir(const QString& sourceDir, const QString& destDir)
{
    QDir source(QFileInfo(sourceDir).absoluteFilePath());
    return QDir::cleanPath(source.absoluteFilePath(destDir));
}

QString BackupRelocator::archiveNameFor(const QString& backupDir)
{
    return QDir::cleanPath(backupDir) + "_old";
}

RelocationResult BackupRelocator::relocate(const QString& sourceDir,
                                           const QString& destDir,
                                           const QStringList& patterns)
{
    QFileInfo sourceInfo(sourceDir);
    if (!sourceInfo.exists() || !sourceInfo.isDir()) {
        throw ConfigurationError(QString("source directory does not exist: %1").arg(sourceDir));
    }
    if (!sourceInfo.isReadable()) {
        throw ConfigurationError(QString("source directory is not readable: %1").arg(sourceDir));
    }

    RelocationResult result;
    result.sourceDir = QDir::cleanPath(sourceInfo.absoluteFilePath());
    result.backupDir = resolveBackupDir(result.sourceDir, destDir);

    if (result.backupDir == result.sourceDir) {
        throw ConfigurationError(QString("backup directory must differ from the source directory: %1")
                                 .arg(result.backupDir));
    }

    // Archiving an ancestor would carry the source directory along with it
    const QString backupPrefix = result.backupDir.endsWith('/') ? result.backupDir : result.backupDir + '/';
    if (result.sourceDir.startsWith(backupPrefix)) {
        throw ConfigurationError(QString("backup directory %1 must not contain the source directory %2")
                                 .arg(result.backupDir, result.sourceDir));
    }

    // Decide everything before touching the filesystem
    const QStringList fileNames = scan(result.sourceDir, patterns);
    const QString archiveDir = archiveNameFor(result.backupDir);
    const bool backupExists = QFileInfo::exists(result.backupDir);

    if (backupExists && QFileInfo::exists(archiveDir)) {
        throw ConfigurationError(QString("cannot archive %1: %2 already exists")
                                 .arg(result.backupDir, archiveDir));
    }

    QDir root;
    if (backupExists) {
        if (!root.rename(result.backupDir, archiveDir)) {
            throw RelocationError(QString("failed to rename %1 to %2").arg(result.backupDir, archiveDir));
        }
        result.archivedDir = archiveDir;
        qCInfo(lcRelocate) << "Archived previous backup directory to" << archiveDir;
    }

    if (!root.mkpath(result.backupDir)) {
        restoreArchive(result);
        throw RelocationError(QString("failed to create backup directory %1").arg(result.backupDir));
    }

    QDir source(result.sourceDir);
    QDir backup(result.backupDir);
    for (const QString& fileName : fileNames) {
        const QString from = source.absoluteFilePath(fileName);
        const QString to = backup.absoluteFilePath(fileName);

        QFile file(from);
        if (!file.rename(to)) {
            const QString reason = file.errorString();
            qCCritical(lcRelocate) << "Failed to move" << from << "to" << to << ":" << reason;
            rollback(result);
            throw RelocationError(QString("failed to move %1 to %2: %3").arg(from, to, reason));
        }

        result.files.append(RelocatedFile(from, to));
        qCDebug(lcRelocate) << "Moved" << from << "to" << to;
    }

    qCInfo(lcRelocate) << "Moved" << result.files.size() << "video(s) to" << result.backupDir;
    return result;
}

void BackupRelocator::rollback(const RelocationResult& result)
{
    bool restored = true;
    for (const RelocatedFile& file : result.files) {
        if (!QFile::rename(file.backupPath, file.originalPath)) {
            qCWarning(lcRelocate) << "Rollback failed, original remains at" << file.backupPath;
            restored = false;
        }
    }

    // The new backup directory still holds originals, keep it and the archive as they are
    if (!restored) {
        return;
    }
    if (!QDir().rmdir(result.backupDir)) {
        qCWarning(lcRelocate) << "Failed to remove" << result.backupDir << "after rollback";
        return;
    }
    restoreArchive(result);
}

void BackupRelocator::restoreArchive(const RelocationResult& result)
{
    if (result.archivedDir.isEmpty()) {
        return;
    }
    if (QDir().rename(result.archivedDir, result.backupDir)) {
        qCInfo(lcRelocate) << "Restored previous backup directory" << result.backupDir;
    } else {
        qCWarning(lcRelocate) << "Failed to restore" << result.archivedDir << "to" << result.backupDir;
    }
}
