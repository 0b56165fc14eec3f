#ifndef BACKUPRELOCATOR_H
#define BACKUPRELOCATOR_H

#include <QList>
#include <QString>
#include <QStringList>

/**
 * @brief One video moved out of the source directory
 */
struct RelocatedFile {
    QString originalPath;   // e.g., "/data/clips/a.mp4", where the converted output goes
    QString backupPath;     // e.g., "/data/clips/unsubtracted_videos/a.mp4"

    RelocatedFile() = default;
    RelocatedFile(const QString& original, const QString& backup)
        : originalPath(original), backupPath(backup) {}
};

struct RelocationResult {
    QString sourceDir;          // Absolute source directory
    QString backupDir;          // Absolute backup directory, freshly created
    QString archivedDir;        // "<backupDir>_old" if a previous backup was archived, else empty
    QList<RelocatedFile> files;
};

/**
 * @brief Archives original videos before conversion
 *
 * Moves (never copies) the top-level videos of a source directory into a
 * backup directory. An existing backup directory is renamed to
 * "<destDir>_old" first; if that name is taken too the call fails without
 * touching anything.
 */
class BackupRelocator
{
public:
    /**
     * @brief List the videos of a directory that relocate() would move
     * @param sourceDir Directory to scan (top level only)
     * @param patterns Case-sensitive name filters, e.g. {"*.mp4"}
     * @return File names sorted by name
     */
    static QStringList scan(const QString& sourceDir, const QStringList& patterns);

    /**
     * @brief Move the source directory's videos into the backup directory
     * @param sourceDir Existing, readable directory holding the videos
     * @param destDir Backup directory; relative paths are resolved against sourceDir
     * @param patterns Name filters selecting the videos
     * @return Mapping from original path to backup path for every moved file
     * @throws ConfigurationError if sourceDir is unusable, destDir is sourceDir or one of its
     *         ancestors, or "<destDir>_old" already exists
     * @throws RelocationError if a rename, mkdir or move fails; files moved so far are put back
     *         and an archived backup directory is restored
     */
    static RelocationResult relocate(const QString& sourceDir,
                                     const QString& destDir,
                                     const QStringList& patterns = QStringList{"*.mp4"});

    /**
     * @brief Absolute backup directory for a source directory
     * @param sourceDir Source directory
     * @param destDir Backup directory as configured
     * @return Clean absolute path
     */
    static QString resolveBackupDir(const QString& sourceDir, const QString& destDir);

    /**
     * @brief Name an existing backup directory is archived under
     */
    static QString archiveNameFor(const QString& backupDir);

private:
    /**
     * @brief Put moved files back and undo the backup directory swap
     */
    static void rollback(const RelocationResult& result);

    /**
     * @brief Rename "<backupDir>_old" back to the backup directory, if it was archived
     */
    static void restoreArchive(const RelocationResult& result);
};

#endif // BACKUPRELOCATOR_H
